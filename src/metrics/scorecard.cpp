#include "sweguard/metrics/scorecard.hpp"

#include "sweguard/common/json_util.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace sweguard::metrics {

namespace {

double ratio(const std::uint64_t numerator, const std::uint64_t denominator) {
  if (denominator == 0) {
    return 0.0;
  }
  return static_cast<double>(numerator) / static_cast<double>(denominator);
}

std::string fixed6(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(6) << value;
  return out.str();
}

common::Status read_count(const common::JsonFlatMap &fields, const std::string &key,
                          std::uint64_t &out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return common::Status::error("scorecard is missing '" + key + "'");
  }
  if (!common::json_parse_u64(it->second, out)) {
    return common::Status::error("scorecard field '" + key + "' is not a count");
  }
  return common::Status::success();
}

common::Status read_bool(const common::JsonFlatMap &fields, const std::string &key, bool &out) {
  const auto it = fields.find(key);
  if (it == fields.end() || (it->second != "true" && it->second != "false")) {
    return common::Status::error("scorecard row field '" + key + "' is not a boolean");
  }
  out = it->second == "true";
  return common::Status::success();
}

common::Result<ScorecardRow> decode_row(const std::string &json) {
  auto parsed = common::json_parse_object(json);
  if (!parsed.ok()) {
    return common::Result<ScorecardRow>::failure("malformed scorecard row: " + parsed.error());
  }
  const auto &fields = parsed.value();

  ScorecardRow row;
  const auto id = fields.find("instance_id");
  if (id == fields.end() || id->second.empty()) {
    return common::Result<ScorecardRow>::failure("scorecard row without instance_id");
  }
  row.instance_id = id->second;
  if (const auto repo = fields.find("repo"); repo != fields.end()) {
    row.repo = repo->second;
  }
  const auto verdict_field = fields.find("verdict");
  const auto verdict = verdict_field == fields.end()
                           ? std::nullopt
                           : harness::parse_task_verdict(verdict_field->second);
  if (!verdict.has_value()) {
    return common::Result<ScorecardRow>::failure("scorecard row " + row.instance_id +
                                                 " has an unknown verdict");
  }
  row.verdict = *verdict;

  for (const auto &status : {read_bool(fields, "resolved_at_1", row.resolved_at_1),
                             read_bool(fields, "resolved_at_3", row.resolved_at_3),
                             read_count(fields, "attempts", row.attempts),
                             read_count(fields, "turns", row.turns),
                             read_count(fields, "tokens", row.tokens)}) {
    if (!status.ok()) {
      return common::Result<ScorecardRow>::failure(status.error());
    }
  }
  return common::Result<ScorecardRow>::success(std::move(row));
}

} // namespace

double Scorecard::resolved_rate_at_1() const { return ratio(resolved_at_1, total_tasks); }

double Scorecard::resolved_rate_at_3() const { return ratio(resolved_at_3, total_tasks); }

double Scorecard::mean_tokens() const { return ratio(total_tokens, total_tasks); }

double Scorecard::mean_turns_per_attempt() const { return ratio(total_turns, total_attempts); }

void Scorecard::sort_rows() {
  std::sort(rows.begin(), rows.end(), [](const ScorecardRow &lhs, const ScorecardRow &rhs) {
    return lhs.instance_id < rhs.instance_id;
  });
}

void fold_outcome(Scorecard &scorecard, const harness::TaskOutcome &outcome) {
  scorecard.total_tasks += 1;
  switch (outcome.verdict) {
  case harness::TaskVerdict::Resolved:
    scorecard.resolved += 1;
    break;
  case harness::TaskVerdict::UnresolvedWithPatch:
    scorecard.unresolved_with_patch += 1;
    break;
  case harness::TaskVerdict::NoPatch:
    scorecard.no_patch += 1;
    break;
  case harness::TaskVerdict::Errored:
    scorecard.errored += 1;
    break;
  }
  scorecard.resolved_at_1 += outcome.resolved_at_1 ? 1 : 0;
  scorecard.resolved_at_3 += outcome.resolved_at_3 ? 1 : 0;
  scorecard.total_attempts += outcome.attempts.size();
  scorecard.total_turns += outcome.total_turns();
  scorecard.total_tokens += outcome.total_tokens();

  scorecard.rows.push_back(ScorecardRow{
      .instance_id = outcome.instance_id,
      .repo = outcome.repo,
      .verdict = outcome.verdict,
      .resolved_at_1 = outcome.resolved_at_1,
      .resolved_at_3 = outcome.resolved_at_3,
      .attempts = outcome.attempts.size(),
      .turns = outcome.total_turns(),
      .tokens = outcome.total_tokens(),
  });
}

std::string encode_scorecard_json(const Scorecard &scorecard) {
  Scorecard sorted = scorecard;
  sorted.sort_rows();

  std::ostringstream out;
  out << "{\n";
  out << "  \"total_tasks\": " << sorted.total_tasks << ",\n";
  out << "  \"resolved\": " << sorted.resolved << ",\n";
  out << "  \"unresolved_with_patch\": " << sorted.unresolved_with_patch << ",\n";
  out << "  \"no_patch\": " << sorted.no_patch << ",\n";
  out << "  \"errored\": " << sorted.errored << ",\n";
  out << "  \"resolved_at_1\": " << sorted.resolved_at_1 << ",\n";
  out << "  \"resolved_at_3\": " << sorted.resolved_at_3 << ",\n";
  out << "  \"resolved_rate_at_1\": " << fixed6(sorted.resolved_rate_at_1()) << ",\n";
  out << "  \"resolved_rate_at_3\": " << fixed6(sorted.resolved_rate_at_3()) << ",\n";
  out << "  \"total_attempts\": " << sorted.total_attempts << ",\n";
  out << "  \"total_turns\": " << sorted.total_turns << ",\n";
  out << "  \"total_tokens\": " << sorted.total_tokens << ",\n";
  out << "  \"mean_tokens\": " << fixed6(sorted.mean_tokens()) << ",\n";
  out << "  \"mean_turns_per_attempt\": " << fixed6(sorted.mean_turns_per_attempt()) << ",\n";
  out << "  \"tasks\": [";
  for (std::size_t i = 0; i < sorted.rows.size(); ++i) {
    const auto &row = sorted.rows[i];
    out << (i == 0 ? "\n" : ",\n");
    out << "    {\"instance_id\": " << common::json_quote(row.instance_id)
        << ", \"repo\": " << common::json_quote(row.repo) << ", \"verdict\": "
        << common::json_quote(std::string(harness::task_verdict_name(row.verdict)))
        << ", \"resolved_at_1\": " << (row.resolved_at_1 ? "true" : "false")
        << ", \"resolved_at_3\": " << (row.resolved_at_3 ? "true" : "false")
        << ", \"attempts\": " << row.attempts << ", \"turns\": " << row.turns
        << ", \"tokens\": " << row.tokens << "}";
  }
  out << (sorted.rows.empty() ? "]\n" : "\n  ]\n");
  out << "}\n";
  return out.str();
}

common::Result<Scorecard> decode_scorecard_json(const std::string &json) {
  auto parsed = common::json_parse_object(json);
  if (!parsed.ok()) {
    return common::Result<Scorecard>::failure("malformed scorecard: " + parsed.error());
  }
  const auto &fields = parsed.value();

  Scorecard scorecard;
  for (const auto &status :
       {read_count(fields, "total_tasks", scorecard.total_tasks),
        read_count(fields, "resolved", scorecard.resolved),
        read_count(fields, "unresolved_with_patch", scorecard.unresolved_with_patch),
        read_count(fields, "no_patch", scorecard.no_patch),
        read_count(fields, "errored", scorecard.errored),
        read_count(fields, "resolved_at_1", scorecard.resolved_at_1),
        read_count(fields, "resolved_at_3", scorecard.resolved_at_3),
        read_count(fields, "total_attempts", scorecard.total_attempts),
        read_count(fields, "total_turns", scorecard.total_turns),
        read_count(fields, "total_tokens", scorecard.total_tokens)}) {
    if (!status.ok()) {
      return common::Result<Scorecard>::failure(status.error());
    }
  }

  const auto tasks = fields.find("tasks");
  if (tasks == fields.end()) {
    return common::Result<Scorecard>::failure("scorecard is missing 'tasks'");
  }
  for (const auto &object : common::json_split_top_level_objects(tasks->second)) {
    auto row = decode_row(object);
    if (!row.ok()) {
      return common::Result<Scorecard>::failure(row.error());
    }
    scorecard.rows.push_back(std::move(row.value()));
  }
  if (scorecard.rows.size() != scorecard.total_tasks) {
    return common::Result<Scorecard>::failure("scorecard lists " +
                                              std::to_string(scorecard.rows.size()) +
                                              " tasks but counts " +
                                              std::to_string(scorecard.total_tasks));
  }
  scorecard.sort_rows();
  return common::Result<Scorecard>::success(std::move(scorecard));
}

std::string format_scorecard_summary(const Scorecard &scorecard) {
  std::ostringstream out;
  out << "Tasks:                  " << scorecard.total_tasks << "\n";
  out << "  resolved:             " << scorecard.resolved << "\n";
  out << "  unresolved w/ patch:  " << scorecard.unresolved_with_patch << "\n";
  out << "  no patch:             " << scorecard.no_patch << "\n";
  out << "  errored:              " << scorecard.errored << "\n";
  out << std::fixed << std::setprecision(1);
  out << "pass@1:                 " << scorecard.resolved_rate_at_1() * 100.0 << "% ("
      << scorecard.resolved_at_1 << "/" << scorecard.total_tasks << ")\n";
  out << "pass@3:                 " << scorecard.resolved_rate_at_3() * 100.0 << "% ("
      << scorecard.resolved_at_3 << "/" << scorecard.total_tasks << ")\n";
  out << "Attempts:               " << scorecard.total_attempts << "\n";
  out << "Turns per attempt:      " << std::setprecision(2)
      << scorecard.mean_turns_per_attempt() << "\n";
  out << "Tokens:                 " << scorecard.total_tokens << " (mean "
      << std::setprecision(1) << scorecard.mean_tokens() << " per task)\n";

  if (!scorecard.rows.empty()) {
    out << "\n";
    for (const auto &row : scorecard.rows) {
      out << "  " << std::left << std::setw(40) << row.instance_id << std::setw(24)
          << harness::task_verdict_name(row.verdict) << " turns=" << row.turns
          << " tokens=" << row.tokens << "\n";
    }
  }
  return out.str();
}

} // namespace sweguard::metrics
