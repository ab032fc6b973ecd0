#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sweguard/metrics/aggregator.hpp"
#include "sweguard/metrics/scorecard.hpp"

#include <algorithm>
#include <thread>

namespace {

namespace hs = sweguard::harness;
namespace mx = sweguard::metrics;

hs::Attempt attempt(const std::uint32_t index, const hs::AttemptOutcome outcome,
                    const std::uint32_t turns, const std::uint64_t tokens) {
  hs::Attempt result;
  result.index = index;
  result.outcome = outcome;
  result.turns = turns;
  result.tokens = tokens;
  return result;
}

hs::TaskOutcome resolved_second_try(const std::string &id) {
  return hs::summarize_attempts(id, "demo/calc",
                                {attempt(1, hs::AttemptOutcome::NoPatch, 10, 500),
                                 attempt(2, hs::AttemptOutcome::Resolved, 4, 200)});
}

hs::TaskOutcome errored(const std::string &id) {
  return hs::summarize_attempts(id, "demo/other", {attempt(1, hs::AttemptOutcome::Errored, 0, 0)});
}

hs::TaskOutcome patched(const std::string &id) {
  return hs::summarize_attempts(id, "demo/calc",
                                {attempt(1, hs::AttemptOutcome::PatchFailed, 6, 300)});
}

} // namespace

void register_metrics_tests(std::vector<sweguard::tests::TestCase> &tests) {
  using sweguard::tests::require;

  tests.push_back({"scorecard_folds_outcomes_into_counters", [] {
                     mx::Scorecard scorecard;
                     mx::fold_outcome(scorecard, resolved_second_try("b"));
                     mx::fold_outcome(scorecard, errored("a"));
                     mx::fold_outcome(scorecard, patched("c"));

                     require(scorecard.total_tasks == 3, "three tasks");
                     require(scorecard.resolved == 1 && scorecard.errored == 1 &&
                                 scorecard.unresolved_with_patch == 1 && scorecard.no_patch == 0,
                             "verdict counters");
                     require(scorecard.resolved_at_1 == 0 && scorecard.resolved_at_3 == 1,
                             "pass@k counters");
                     require(scorecard.total_attempts == 4, "attempts");
                     require(scorecard.total_turns == 20 && scorecard.total_tokens == 1000, "totals");
                     require(scorecard.rows.size() == 3 && scorecard.rows[0].instance_id == "b",
                             "rows in fold order until sorted");
                     scorecard.sort_rows();
                     require(scorecard.rows[0].instance_id == "a", "sorted rows");
                     require(scorecard.rows[1].attempts == 2 && scorecard.rows[1].turns == 14 &&
                                 scorecard.rows[1].tokens == 700,
                             "row totals");
                   }});

  tests.push_back({"scorecard_rates_handle_empty_runs", [] {
                     mx::Scorecard empty;
                     require(empty.resolved_rate_at_1() == 0.0 && empty.resolved_rate_at_3() == 0.0,
                             "no division by zero");
                     require(empty.mean_tokens() == 0.0 && empty.mean_turns_per_attempt() == 0.0,
                             "no division by zero in means");

                     mx::Scorecard scorecard;
                     mx::fold_outcome(scorecard, resolved_second_try("a"));
                     mx::fold_outcome(scorecard, patched("b"));
                     require(scorecard.resolved_rate_at_3() == 0.5, "pass@3 rate");
                     require(scorecard.mean_tokens() == 500.0, "mean tokens per task");
                     require(scorecard.mean_turns_per_attempt() == 20.0 / 3.0, "turns per attempt");
                   }});

  tests.push_back({"scorecard_json_is_stable_and_decodes", [] {
                     mx::Scorecard scorecard;
                     mx::fold_outcome(scorecard, patched("zeta"));
                     mx::fold_outcome(scorecard, resolved_second_try("alpha"));
                     const auto json = mx::encode_scorecard_json(scorecard);
                     require(json.find("\"resolved_rate_at_3\": 0.500000") != std::string::npos,
                             "fixed precision rates");
                     require(json.find("alpha") < json.find("zeta"), "rows sorted by id");
                     require(mx::encode_scorecard_json(scorecard) == json, "deterministic");

                     const auto decoded = mx::decode_scorecard_json(json);
                     require(decoded.ok(), decoded.error());
                     require(decoded.value().total_tasks == 2 && decoded.value().resolved == 1,
                             "counters decoded");
                     require(decoded.value().rows[0].instance_id == "alpha" &&
                                 decoded.value().rows[0].verdict == hs::TaskVerdict::Resolved &&
                                 decoded.value().rows[0].resolved_at_3,
                             "rows decoded");
                     require(decoded.value().rows[1].verdict == hs::TaskVerdict::UnresolvedWithPatch,
                             "second row verdict");
                   }});

  tests.push_back({"scorecard_decode_rejects_inconsistent_documents", [] {
                     mx::Scorecard scorecard;
                     mx::fold_outcome(scorecard, patched("a"));
                     auto json = mx::encode_scorecard_json(scorecard);
                     const auto at = json.find("\"total_tasks\": 1");
                     require(at != std::string::npos, "total_tasks present");
                     json.replace(at, std::string("\"total_tasks\": 1").size(), "\"total_tasks\": 2");
                     const auto mismatched = mx::decode_scorecard_json(json);
                     require(!mismatched.ok(), "row count mismatch rejected");
                     require(mismatched.error().find("lists 1 tasks but counts 2") != std::string::npos,
                             mismatched.error());

                     require(!mx::decode_scorecard_json("not json").ok(), "garbage rejected");
                     require(!mx::decode_scorecard_json("{\"total_tasks\": 0}").ok(),
                             "missing counters rejected");
                   }});

  tests.push_back({"scorecard_summary_lists_rates_and_rows", [] {
                     mx::Scorecard scorecard;
                     mx::fold_outcome(scorecard, resolved_second_try("demo__calc-1"));
                     mx::fold_outcome(scorecard, errored("demo__calc-2"));
                     scorecard.sort_rows();
                     const auto summary = mx::format_scorecard_summary(scorecard);
                     require(summary.find("pass@1:                 0.0% (0/2)") != std::string::npos,
                             summary);
                     require(summary.find("pass@3:                 50.0% (1/2)") != std::string::npos,
                             summary);
                     require(summary.find("demo__calc-2") != std::string::npos, "rows listed");
                     require(summary.find("errored") != std::string::npos, "verdicts listed");
                   }});

  tests.push_back({"aggregator_folds_concurrent_submissions", [] {
                     mx::MetricsAggregator aggregator;
                     std::vector<std::thread> workers;
                     for (int w = 0; w < 4; ++w) {
                       workers.emplace_back([&aggregator, w] {
                         for (int i = 0; i < 25; ++i) {
                           require(aggregator.submit(patched("task-" + std::to_string(w) + "-" +
                                                             std::to_string(i))),
                                   "submit accepted");
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     const auto snapshot = aggregator.snapshot();
                     require(snapshot.total_tasks == 100, "every submission folded");
                     require(snapshot.total_tokens == 30'000, "token total");
                     require(std::is_sorted(snapshot.rows.begin(), snapshot.rows.end(),
                                            [](const mx::ScorecardRow &lhs,
                                               const mx::ScorecardRow &rhs) {
                                              return lhs.instance_id < rhs.instance_id;
                                            }),
                             "snapshot rows sorted");
                   }});

  tests.push_back({"aggregator_finish_is_idempotent_and_final", [] {
                     mx::MetricsAggregator aggregator;
                     require(aggregator.submit(errored("a")), "accepted");
                     const auto first = aggregator.finish();
                     const auto second = aggregator.finish();
                     require(first.total_tasks == 1 && second.total_tasks == 1, "same result");
                     require(!aggregator.submit(errored("b")), "closed after finish");
                     require(aggregator.snapshot().total_tasks == 1, "snapshot after finish");
                   }});
}
