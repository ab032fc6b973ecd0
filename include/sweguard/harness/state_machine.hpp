#pragma once

#include "sweguard/agent/channel.hpp"
#include "sweguard/common/cancellation.hpp"
#include "sweguard/config/schema.hpp"
#include "sweguard/sandbox/manager.hpp"
#include "sweguard/security/policy.hpp"
#include "sweguard/task/task.hpp"
#include "sweguard/validator/validator.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sweguard::harness {

enum class AttemptState { Exploring, Debugging, Patched, Resolved, Unresolved, Errored, TimedOut };

enum class AttemptOutcome { Pending, Resolved, PatchFailed, NoPatch, Errored, TimedOut };

[[nodiscard]] std::string_view attempt_state_name(AttemptState state);
[[nodiscard]] std::string_view attempt_outcome_name(AttemptOutcome outcome);
[[nodiscard]] std::optional<AttemptOutcome> parse_attempt_outcome(std::string_view name);

/// Exit code reported to the agent for a reply that could not be turned into an action.
constexpr int PROTOCOL_ERROR_EXIT_CODE = 2;

struct TranscriptEntry {
  std::uint32_t turn = 0;
  std::string kind;
  std::string content;
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
  bool timed_out = false;
  std::string denied_rule;
  std::uint64_t tokens = 0;
  std::chrono::milliseconds duration{0};
};

[[nodiscard]] std::string encode_transcript_json(const std::vector<TranscriptEntry> &transcript);

struct Attempt {
  std::uint32_t index = 0;
  AttemptState state = AttemptState::Exploring;
  AttemptOutcome outcome = AttemptOutcome::Pending;
  std::uint32_t turns = 0;
  std::uint64_t tokens = 0;
  std::vector<TranscriptEntry> transcript;
  std::optional<std::string> submitted_patch;
  std::optional<validator::PatchResult> patch;
  std::string error;
  std::string started_at;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] bool resolved() const { return outcome == AttemptOutcome::Resolved; }
  [[nodiscard]] bool patch_applied() const { return patch.has_value() && patch->applied; }
};

/// Drives one attempt: provisions the workspace, relays actions between the agent and the
/// sandboxes, and stops on a patch, the turn limit, the task deadline or cancellation.
class InteractionStateMachine {
public:
  InteractionStateMachine(const config::RunConfig &run, sandbox::SandboxManager &manager,
                          const security::SecurityPolicy &policy,
                          validator::PatchValidator &validator, agent::IAgentChannel &channel);

  [[nodiscard]] Attempt run(const task::Task &task, std::uint32_t attempt_index,
                            const common::CancellationToken &cancel);

private:
  struct TurnResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool timed_out = false;
    std::string denied_rule;
    std::string cwd;
    std::chrono::milliseconds duration{0};
  };

  void drive(const task::Task &task, Attempt &attempt, const common::Deadline &deadline,
             const common::CancellationToken &cancel);
  [[nodiscard]] common::Result<TurnResult> run_debug(const task::Task &task,
                                                     const sandbox::Sandbox &main,
                                                     const std::string &command,
                                                     const common::Deadline &deadline,
                                                     const common::CancellationToken &cancel);
  [[nodiscard]] common::Result<TurnResult>
  run_command(const task::Task &task, sandbox::Sandbox &sandbox, security::ExecutionMode mode,
              const std::string &command, const common::Deadline &deadline,
              const common::CancellationToken &cancel) const;
  void finish(Attempt &attempt, AttemptOutcome outcome, std::string error = "") const;

  config::RunConfig run_;
  sandbox::SandboxManager &manager_;
  const security::SecurityPolicy &policy_;
  validator::PatchValidator &validator_;
  agent::IAgentChannel &channel_;
};

} // namespace sweguard::harness
