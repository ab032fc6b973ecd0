#include "sweguard/validator/validator.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/observability/global.hpp"
#include "sweguard/patch/diff.hpp"
#include "sweguard/validator/test_command.hpp"

#include <algorithm>
#include <unordered_set>

namespace sweguard::validator {

namespace {

std::string tail_of(const std::string &stdout_text, const std::string &stderr_text) {
  std::string combined = stdout_text;
  if (!stderr_text.empty()) {
    if (!combined.empty() && combined.back() != '\n') {
      combined.push_back('\n');
    }
    combined += stderr_text;
  }
  if (combined.size() <= OUTPUT_TAIL_BYTES) {
    return combined;
  }
  return combined.substr(combined.size() - OUTPUT_TAIL_BYTES);
}

std::string with_trailing_newline(std::string text) {
  if (!text.empty() && text.back() != '\n') {
    text.push_back('\n');
  }
  return text;
}

std::string apply_message(const sandbox::CommandResult &result) {
  std::string message = common::trim(result.stderr_text);
  if (message.empty()) {
    message = common::trim(result.stdout_text);
  }
  if (message.empty()) {
    message = "git apply exited with " + std::to_string(result.exit_code);
  }
  return message;
}

void report(const task::Task &task, const PatchResult &result) {
  observability::record_event(observability::ValidationEvent{
      .instance_id = task.instance_id,
      .applied = result.applied,
      .resolved = result.resolved(),
      .passed = result.passed(),
      .total = result.fail_to_pass_total + result.pass_to_pass_total,
  });
}

} // namespace

std::string_view test_group_name(const TestGroup group) {
  return group == TestGroup::FailToPass ? "FAIL_TO_PASS" : "PASS_TO_PASS";
}

std::string_view test_verdict_name(const TestVerdict verdict) {
  switch (verdict) {
  case TestVerdict::Pass:
    return "pass";
  case TestVerdict::Fail:
    return "fail";
  case TestVerdict::Error:
    return "error";
  }
  return "error";
}

TestVerdict classify_test_exit(const int exit_code, const bool timed_out) {
  if (timed_out) {
    return TestVerdict::Error;
  }
  if (exit_code == 0) {
    return TestVerdict::Pass;
  }
  if (exit_code == 1) {
    return TestVerdict::Fail;
  }
  return TestVerdict::Error;
}

bool PatchResult::resolved() const {
  if (!applied || verdicts.size() != fail_to_pass_total + pass_to_pass_total) {
    return false;
  }
  return std::all_of(verdicts.begin(), verdicts.end(), [](const TestVerdictRecord &record) {
    return record.verdict == TestVerdict::Pass;
  });
}

std::size_t PatchResult::tests_fixed() const {
  return static_cast<std::size_t>(
      std::count_if(verdicts.begin(), verdicts.end(), [](const TestVerdictRecord &record) {
        return record.group == TestGroup::FailToPass && record.verdict == TestVerdict::Pass;
      }));
}

std::size_t PatchResult::tests_broken() const {
  return static_cast<std::size_t>(
      std::count_if(verdicts.begin(), verdicts.end(), [](const TestVerdictRecord &record) {
        return record.group == TestGroup::PassToPass && record.verdict != TestVerdict::Pass;
      }));
}

std::size_t PatchResult::passed() const {
  return static_cast<std::size_t>(
      std::count_if(verdicts.begin(), verdicts.end(), [](const TestVerdictRecord &record) {
        return record.verdict == TestVerdict::Pass;
      }));
}

double PatchResult::score() const {
  if (fail_to_pass_total == 0) {
    return 0.0;
  }
  return static_cast<double>(tests_fixed()) / static_cast<double>(fail_to_pass_total);
}

PatchValidator::PatchValidator(sandbox::SandboxManager &manager, config::ValidatorConfig config)
    : manager_(manager), config_(std::move(config)) {}

common::Result<PatchResult> PatchValidator::validate(const task::Task &task,
                                                     const std::string &diff,
                                                     const common::Deadline &deadline,
                                                     const common::CancellationToken &cancel) {
  PatchResult result;
  result.fail_to_pass_total = task.fail_to_pass.size();
  result.pass_to_pass_total = task.pass_to_pass.size();

  if (common::trim(diff).empty()) {
    result.apply_error = "empty patch";
    report(task, result);
    return common::Result<PatchResult>::success(std::move(result));
  }

  const auto touched = patch::touched_paths(diff);
  const std::unordered_set<std::string> protected_paths(task.protected_paths.begin(),
                                                        task.protected_paths.end());
  std::vector<std::string> offending;
  for (const auto &path : touched) {
    if (protected_paths.contains(path)) {
      offending.push_back(path);
    }
  }
  if (!offending.empty()) {
    result.apply_error = "patch modifies protected test files:";
    for (const auto &path : offending) {
      result.apply_error += " " + path;
    }
    report(task, result);
    return common::Result<PatchResult>::success(std::move(result));
  }

  if (cancel.is_cancelled()) {
    return common::Result<PatchResult>::failure("cancelled");
  }
  if (deadline.expired()) {
    return common::Result<PatchResult>::failure("deadline exceeded before validation");
  }

  auto provisioned = manager_.provision_validation(task, cancel);
  if (!provisioned.ok()) {
    return common::Result<PatchResult>::failure(provisioned.error());
  }
  sandbox::ScopedSandbox guard(manager_, std::move(provisioned.value()));

  auto validated = run_in_sandbox(guard.get(), task, diff, deadline, cancel);
  if (validated.ok()) {
    report(task, validated.value());
  }
  return validated;
}

common::Result<PatchResult> PatchValidator::run_in_sandbox(sandbox::Sandbox &sandbox,
                                                           const task::Task &task,
                                                           const std::string &diff,
                                                           const common::Deadline &deadline,
                                                           const common::CancellationToken &cancel) {
  PatchResult result;
  result.fail_to_pass_total = task.fail_to_pass.size();
  result.pass_to_pass_total = task.pass_to_pass.size();
  const auto apply_timeout = std::chrono::seconds(config_.apply_timeout_secs);

  if (!common::trim(task.test_patch).empty()) {
    auto staged = manager_.execute(sandbox, "git apply -", deadline.clamp(apply_timeout), cancel,
                                   with_trailing_newline(task.test_patch));
    if (!staged.ok()) {
      return common::Result<PatchResult>::failure(staged.error());
    }
    if (staged.value().exit_code != 0) {
      return common::Result<PatchResult>::failure("test patch does not apply: " +
                                                  apply_message(staged.value()));
    }
  }

  const std::string submitted = with_trailing_newline(diff);
  for (const char *command : {"git apply --check -", "git apply -"}) {
    auto applied =
        manager_.execute(sandbox, command, deadline.clamp(apply_timeout), cancel, submitted);
    if (!applied.ok()) {
      return common::Result<PatchResult>::failure(applied.error());
    }
    if (applied.value().exit_code != 0) {
      result.apply_error = apply_message(applied.value());
      return common::Result<PatchResult>::success(std::move(result));
    }
  }
  result.applied = true;

  const auto test_timeout = std::chrono::seconds(config_.test_timeout_secs);
  auto run_group = [&](const std::vector<std::string> &ids,
                       const TestGroup group) -> common::Status {
    for (const auto &test_id : ids) {
      if (cancel.is_cancelled()) {
        return common::Status::error("cancelled");
      }
      TestVerdictRecord record{.test_id = test_id,
                               .group = group,
                               .verdict = TestVerdict::Error,
                               .output_tail = "",
                               .duration = std::chrono::milliseconds(0)};
      if (deadline.expired()) {
        record.output_tail = "deadline exceeded before the test ran";
        result.verdicts.push_back(std::move(record));
        continue;
      }
      const std::string command = build_test_command(task.repo, task.version, test_id);
      auto ran = manager_.execute(sandbox, command, deadline.clamp(test_timeout), cancel, "",
                                  true);
      if (!ran.ok()) {
        return common::Status::error(ran.error());
      }
      record.verdict = classify_test_exit(ran.value().exit_code, ran.value().timed_out);
      record.output_tail = tail_of(ran.value().stdout_text, ran.value().stderr_text);
      record.duration = ran.value().duration;
      result.verdicts.push_back(std::move(record));
    }
    return common::Status::success();
  };

  if (auto status = run_group(task.fail_to_pass, TestGroup::FailToPass); !status.ok()) {
    return common::Result<PatchResult>::failure(status.error());
  }
  if (auto status = run_group(task.pass_to_pass, TestGroup::PassToPass); !status.ok()) {
    return common::Result<PatchResult>::failure(status.error());
  }
  return common::Result<PatchResult>::success(std::move(result));
}

} // namespace sweguard::validator
