#pragma once

#include "sweguard/common/result.hpp"
#include "sweguard/harness/task_controller.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sweguard::metrics {

struct ScorecardRow {
  std::string instance_id;
  std::string repo;
  harness::TaskVerdict verdict = harness::TaskVerdict::Errored;
  bool resolved_at_1 = false;
  bool resolved_at_3 = false;
  std::uint64_t attempts = 0;
  std::uint64_t turns = 0;
  std::uint64_t tokens = 0;
};

struct Scorecard {
  std::uint64_t total_tasks = 0;
  std::uint64_t resolved = 0;
  std::uint64_t unresolved_with_patch = 0;
  std::uint64_t no_patch = 0;
  std::uint64_t errored = 0;
  std::uint64_t resolved_at_1 = 0;
  std::uint64_t resolved_at_3 = 0;
  std::uint64_t total_attempts = 0;
  std::uint64_t total_turns = 0;
  std::uint64_t total_tokens = 0;
  std::vector<ScorecardRow> rows;

  [[nodiscard]] double resolved_rate_at_1() const;
  [[nodiscard]] double resolved_rate_at_3() const;
  /// Tokens per task.
  [[nodiscard]] double mean_tokens() const;
  [[nodiscard]] double mean_turns_per_attempt() const;

  void sort_rows();
};

/// Adds one task's outcome to the running totals.
void fold_outcome(Scorecard &scorecard, const harness::TaskOutcome &outcome);

/// Canonical form: fixed key order, rates with six decimals, rows sorted by instance id.
[[nodiscard]] std::string encode_scorecard_json(const Scorecard &scorecard);
[[nodiscard]] common::Result<Scorecard> decode_scorecard_json(const std::string &json);

/// Human-readable table printed at the end of a run.
[[nodiscard]] std::string format_scorecard_summary(const Scorecard &scorecard);

} // namespace sweguard::metrics
