#pragma once

#include "sweguard/agent/channel.hpp"
#include "sweguard/harness/state_machine.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sweguard::harness {

enum class TaskVerdict { Resolved, UnresolvedWithPatch, NoPatch, Errored };

[[nodiscard]] std::string_view task_verdict_name(TaskVerdict verdict);
[[nodiscard]] std::optional<TaskVerdict> parse_task_verdict(std::string_view name);

struct TaskOutcome {
  std::string instance_id;
  std::string repo;
  TaskVerdict verdict = TaskVerdict::Errored;
  bool resolved = false;
  bool resolved_at_1 = false;
  bool resolved_at_3 = false;
  std::vector<Attempt> attempts;

  [[nodiscard]] std::uint64_t total_tokens() const;
  [[nodiscard]] std::uint64_t total_turns() const;
};

/// Precedence: any resolved attempt, then any submitted patch, then any attempt that ran out
/// of turns or time; a task is errored only when every attempt errored.
[[nodiscard]] TaskVerdict derive_verdict(const std::vector<Attempt> &attempts);

/// Fills verdict and the pass@k flags from `attempts`.
[[nodiscard]] TaskOutcome summarize_attempts(std::string instance_id, std::string repo,
                                             std::vector<Attempt> attempts);

/// Runs every configured attempt of a task in sequence, each from a fresh workspace.
class TaskController {
public:
  TaskController(const config::RunConfig &run, sandbox::SandboxManager &manager,
                 const security::SecurityPolicy &policy, validator::PatchValidator &validator,
                 agent::IAgentChannelFactory &channels);

  [[nodiscard]] TaskOutcome run(const task::Task &task, const common::CancellationToken &cancel);

private:
  config::RunConfig run_;
  sandbox::SandboxManager &manager_;
  const security::SecurityPolicy &policy_;
  validator::PatchValidator &validator_;
  agent::IAgentChannelFactory &channels_;
};

} // namespace sweguard::harness
