#include "sweguard/harness/task_controller.hpp"

#include <algorithm>

namespace sweguard::harness {

namespace {

constexpr std::uint32_t PASS_AT_K = 3;

} // namespace

std::string_view task_verdict_name(const TaskVerdict verdict) {
  switch (verdict) {
  case TaskVerdict::Resolved:
    return "resolved";
  case TaskVerdict::UnresolvedWithPatch:
    return "unresolved_with_patch";
  case TaskVerdict::NoPatch:
    return "no_patch";
  case TaskVerdict::Errored:
    return "errored";
  }
  return "errored";
}

std::optional<TaskVerdict> parse_task_verdict(const std::string_view name) {
  for (const auto verdict : {TaskVerdict::Resolved, TaskVerdict::UnresolvedWithPatch,
                             TaskVerdict::NoPatch, TaskVerdict::Errored}) {
    if (task_verdict_name(verdict) == name) {
      return verdict;
    }
  }
  return std::nullopt;
}

std::uint64_t TaskOutcome::total_tokens() const {
  std::uint64_t total = 0;
  for (const auto &attempt : attempts) {
    total += attempt.tokens;
  }
  return total;
}

std::uint64_t TaskOutcome::total_turns() const {
  std::uint64_t total = 0;
  for (const auto &attempt : attempts) {
    total += attempt.turns;
  }
  return total;
}

TaskVerdict derive_verdict(const std::vector<Attempt> &attempts) {
  const auto any = [&attempts](auto predicate) {
    return std::any_of(attempts.begin(), attempts.end(), predicate);
  };
  if (any([](const Attempt &attempt) { return attempt.resolved(); })) {
    return TaskVerdict::Resolved;
  }
  if (any([](const Attempt &attempt) {
        return attempt.outcome == AttemptOutcome::PatchFailed || attempt.patch.has_value() ||
               attempt.submitted_patch.has_value();
      })) {
    return TaskVerdict::UnresolvedWithPatch;
  }
  if (any([](const Attempt &attempt) {
        return attempt.outcome == AttemptOutcome::NoPatch ||
               attempt.outcome == AttemptOutcome::TimedOut;
      })) {
    return TaskVerdict::NoPatch;
  }
  return TaskVerdict::Errored;
}

TaskOutcome summarize_attempts(std::string instance_id, std::string repo,
                               std::vector<Attempt> attempts) {
  TaskOutcome outcome;
  outcome.instance_id = std::move(instance_id);
  outcome.repo = std::move(repo);
  outcome.verdict = derive_verdict(attempts);
  outcome.resolved = outcome.verdict == TaskVerdict::Resolved;
  for (const auto &attempt : attempts) {
    if (!attempt.resolved()) {
      continue;
    }
    if (attempt.index == 1) {
      outcome.resolved_at_1 = true;
    }
    if (attempt.index >= 1 && attempt.index <= PASS_AT_K) {
      outcome.resolved_at_3 = true;
    }
  }
  outcome.attempts = std::move(attempts);
  return outcome;
}

TaskController::TaskController(const config::RunConfig &run, sandbox::SandboxManager &manager,
                               const security::SecurityPolicy &policy,
                               validator::PatchValidator &validator,
                               agent::IAgentChannelFactory &channels)
    : run_(run), manager_(manager), policy_(policy), validator_(validator), channels_(channels) {}

TaskOutcome TaskController::run(const task::Task &task, const common::CancellationToken &cancel) {
  std::vector<Attempt> attempts;
  attempts.reserve(run_.max_attempts);
  // Every attempt runs even after one resolves, so pass@k token totals stay comparable.
  for (std::uint32_t index = 1; index <= run_.max_attempts; ++index) {
    auto channel = channels_.create(task.instance_id, index);
    InteractionStateMachine machine(run_, manager_, policy_, validator_, *channel);
    attempts.push_back(machine.run(task, index, cancel));
  }
  return summarize_attempts(task.instance_id, task.repo, std::move(attempts));
}

} // namespace sweguard::harness
