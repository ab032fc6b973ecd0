#pragma once

#include "sweguard/common/cancellation.hpp"
#include "sweguard/common/result.hpp"
#include "sweguard/config/schema.hpp"
#include "sweguard/sandbox/manager.hpp"
#include "sweguard/task/task.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sweguard::validator {

enum class TestGroup { FailToPass, PassToPass };
enum class TestVerdict { Pass, Fail, Error };

[[nodiscard]] std::string_view test_group_name(TestGroup group);
[[nodiscard]] std::string_view test_verdict_name(TestVerdict verdict);

/// Exit 0 passes, exit 1 fails, everything else (timeouts included) is a harness error.
[[nodiscard]] TestVerdict classify_test_exit(int exit_code, bool timed_out);

struct TestVerdictRecord {
  std::string test_id;
  TestGroup group = TestGroup::FailToPass;
  TestVerdict verdict = TestVerdict::Error;
  std::string output_tail;
  std::chrono::milliseconds duration{0};
};

struct PatchResult {
  bool applied = false;
  std::string apply_error;
  std::vector<TestVerdictRecord> verdicts;
  std::size_t fail_to_pass_total = 0;
  std::size_t pass_to_pass_total = 0;

  /// Applied, every expected test ran, and every one of them passed.
  [[nodiscard]] bool resolved() const;
  /// fail_to_pass tests that now pass.
  [[nodiscard]] std::size_t tests_fixed() const;
  /// pass_to_pass tests that no longer pass.
  [[nodiscard]] std::size_t tests_broken() const;
  [[nodiscard]] std::size_t passed() const;
  /// Fraction of fail_to_pass tests that pass.
  [[nodiscard]] double score() const;
};

inline constexpr std::size_t OUTPUT_TAIL_BYTES = 2000;

/// Applies a submitted diff to a fresh checkout and runs the held-out tests against it.
class PatchValidator {
public:
  PatchValidator(sandbox::SandboxManager &manager, config::ValidatorConfig config);

  /// A failure is an infrastructure fault. A diff that does not apply is a successful
  /// result with `applied == false`.
  [[nodiscard]] common::Result<PatchResult> validate(const task::Task &task,
                                                     const std::string &diff,
                                                     const common::Deadline &deadline,
                                                     const common::CancellationToken &cancel);

private:
  [[nodiscard]] common::Result<PatchResult>
  run_in_sandbox(sandbox::Sandbox &sandbox, const task::Task &task, const std::string &diff,
                 const common::Deadline &deadline, const common::CancellationToken &cancel);

  sandbox::SandboxManager &manager_;
  config::ValidatorConfig config_;
};

} // namespace sweguard::validator
