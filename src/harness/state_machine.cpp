#include "sweguard/harness/state_machine.hpp"

#include "sweguard/agent/action.hpp"
#include "sweguard/common/fs.hpp"
#include "sweguard/common/json_util.hpp"
#include "sweguard/observability/global.hpp"

#include <sstream>

namespace sweguard::harness {

namespace {

AttemptState terminal_state(const AttemptOutcome outcome) {
  switch (outcome) {
  case AttemptOutcome::Resolved:
    return AttemptState::Resolved;
  case AttemptOutcome::PatchFailed:
  case AttemptOutcome::NoPatch:
    return AttemptState::Unresolved;
  case AttemptOutcome::TimedOut:
    return AttemptState::TimedOut;
  case AttemptOutcome::Pending:
  case AttemptOutcome::Errored:
    return AttemptState::Errored;
  }
  return AttemptState::Errored;
}

std::string patch_summary(const validator::PatchResult &result) {
  if (!result.applied) {
    return "patch not applied";
  }
  std::ostringstream out;
  out << "patch applied; " << result.passed() << "/"
      << (result.fail_to_pass_total + result.pass_to_pass_total) << " tests passed";
  if (result.resolved()) {
    out << "; resolved";
  }
  return out.str();
}

void emit_turn(const std::string &instance_id, const std::uint32_t attempt,
               const TranscriptEntry &entry) {
  observability::record_event(observability::TurnEvent{
      .instance_id = instance_id,
      .attempt = attempt,
      .turn = entry.turn,
      .action = entry.kind,
      .exit_code = entry.exit_code,
      .timed_out = entry.timed_out,
      .duration = entry.duration,
  });
}

} // namespace

std::string_view attempt_state_name(const AttemptState state) {
  switch (state) {
  case AttemptState::Exploring:
    return "exploring";
  case AttemptState::Debugging:
    return "debugging";
  case AttemptState::Patched:
    return "patched";
  case AttemptState::Resolved:
    return "resolved";
  case AttemptState::Unresolved:
    return "unresolved";
  case AttemptState::Errored:
    return "errored";
  case AttemptState::TimedOut:
    return "timed_out";
  }
  return "errored";
}

std::string_view attempt_outcome_name(const AttemptOutcome outcome) {
  switch (outcome) {
  case AttemptOutcome::Pending:
    return "pending";
  case AttemptOutcome::Resolved:
    return "resolved";
  case AttemptOutcome::PatchFailed:
    return "patch_failed";
  case AttemptOutcome::NoPatch:
    return "no_patch";
  case AttemptOutcome::Errored:
    return "errored";
  case AttemptOutcome::TimedOut:
    return "timed_out";
  }
  return "pending";
}

std::optional<AttemptOutcome> parse_attempt_outcome(const std::string_view name) {
  for (const auto outcome :
       {AttemptOutcome::Pending, AttemptOutcome::Resolved, AttemptOutcome::PatchFailed,
        AttemptOutcome::NoPatch, AttemptOutcome::Errored, AttemptOutcome::TimedOut}) {
    if (attempt_outcome_name(outcome) == name) {
      return outcome;
    }
  }
  return std::nullopt;
}

std::string encode_transcript_json(const std::vector<TranscriptEntry> &transcript) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < transcript.size(); ++i) {
    const auto &entry = transcript[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"turn\":" << entry.turn << ",\"kind\":" << common::json_quote(entry.kind)
        << ",\"content\":" << common::json_quote(entry.content)
        << ",\"stdout\":" << common::json_quote(entry.stdout_text)
        << ",\"stderr\":" << common::json_quote(entry.stderr_text)
        << ",\"exit_code\":" << entry.exit_code
        << ",\"timed_out\":" << (entry.timed_out ? "true" : "false")
        << ",\"denied_rule\":" << common::json_quote(entry.denied_rule)
        << ",\"tokens\":" << entry.tokens << ",\"duration_ms\":" << entry.duration.count()
        << "}";
  }
  out << "]";
  return out.str();
}

InteractionStateMachine::InteractionStateMachine(const config::RunConfig &run,
                                                 sandbox::SandboxManager &manager,
                                                 const security::SecurityPolicy &policy,
                                                 validator::PatchValidator &validator,
                                                 agent::IAgentChannel &channel)
    : run_(run), manager_(manager), policy_(policy), validator_(validator), channel_(channel) {}

Attempt InteractionStateMachine::run(const task::Task &task, const std::uint32_t attempt_index,
                                     const common::CancellationToken &cancel) {
  Attempt attempt;
  attempt.index = attempt_index;
  attempt.started_at = common::now_rfc3339();
  const auto started = std::chrono::steady_clock::now();
  const auto deadline = common::Deadline::after(std::chrono::seconds(run_.task_timeout_secs));

  observability::record_event(
      observability::AttemptStartEvent{.instance_id = task.instance_id, .attempt = attempt_index});

  drive(task, attempt, deadline, cancel);
  if (attempt.outcome == AttemptOutcome::Pending) {
    finish(attempt, AttemptOutcome::Errored, "attempt ended without an outcome");
  }
  attempt.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  channel_.end(agent::AttemptReport{
      .instance_id = task.instance_id,
      .attempt = attempt_index,
      .outcome = std::string(attempt_outcome_name(attempt.outcome)),
      .turns = attempt.turns,
      .tokens = attempt.tokens,
  });
  observability::record_event(observability::AttemptEndEvent{
      .instance_id = task.instance_id,
      .attempt = attempt_index,
      .outcome = std::string(attempt_outcome_name(attempt.outcome)),
      .turns = attempt.turns,
      .tokens = attempt.tokens,
      .duration = attempt.duration,
  });
  return attempt;
}

void InteractionStateMachine::drive(const task::Task &task, Attempt &attempt,
                                    const common::Deadline &deadline,
                                    const common::CancellationToken &cancel) {
  auto interrupted = [&]() {
    if (deadline.expired()) {
      finish(attempt, AttemptOutcome::TimedOut, "task timeout exceeded");
      return true;
    }
    if (cancel.is_cancelled()) {
      finish(attempt, AttemptOutcome::Errored, "cancelled");
      return true;
    }
    return false;
  };
  auto fault = [&](const std::string &error) {
    if (!interrupted()) {
      finish(attempt, AttemptOutcome::Errored, error);
    }
  };

  if (interrupted()) {
    return;
  }
  auto provisioned = manager_.provision_main(task, cancel);
  if (!provisioned.ok()) {
    fault(provisioned.error());
    return;
  }
  sandbox::ScopedSandbox main(manager_, std::move(provisioned.value()));

  auto reply = channel_.begin(agent::SessionStart{.cwd = main->working_dir.string(),
                                                  .problem_statement = task.problem_statement,
                                                  .hints_text = task.hints_text,
                                                  .runtime_version = task.runtime_version,
                                                  .fail_to_pass = task.fail_to_pass},
                              deadline, cancel);

  while (true) {
    if (interrupted()) {
      return;
    }
    if (!reply.ok()) {
      fault("agent channel: " + reply.error());
      return;
    }
    const agent::InboundMessage message = reply.value();
    const std::uint64_t tokens = message.tokens();
    auto action = agent::to_action(message);

    TranscriptEntry entry;
    entry.content = message.content;
    entry.tokens = tokens;
    agent::TurnOutput output;

    if (!action.ok()) {
      attempt.turns += 1;
      attempt.tokens += tokens;
      entry.turn = attempt.turns;
      entry.kind = "protocol";
      entry.stderr_text = action.error();
      entry.exit_code = PROTOCOL_ERROR_EXIT_CODE;
      output = agent::TurnOutput{
          .cwd = main->working_dir.string(), .stdout_text = "", .stderr_text = action.error()};
    } else if (const auto *patch = std::get_if<agent::PatchAction>(&action.value())) {
      attempt.state = AttemptState::Patched;
      attempt.submitted_patch = patch->diff;
      auto validated = validator_.validate(task, patch->diff, deadline, cancel);
      if (!validated.ok()) {
        fault("validation: " + validated.error());
        return;
      }
      const auto &result = validated.value();
      entry.turn = attempt.turns;
      entry.kind = "patch";
      entry.tokens = 0;
      entry.stdout_text = patch_summary(result);
      entry.stderr_text = result.apply_error;
      entry.exit_code = result.resolved() ? 0 : 1;
      for (const auto &record : result.verdicts) {
        entry.duration += record.duration;
      }
      attempt.patch = result;
      emit_turn(task.instance_id, attempt.index, entry);
      attempt.transcript.push_back(std::move(entry));
      if (interrupted()) {
        return;
      }
      finish(attempt, attempt.patch->resolved() ? AttemptOutcome::Resolved
                                                : AttemptOutcome::PatchFailed);
      return;
    } else {
      const bool debug = std::holds_alternative<agent::DebugAction>(action.value());
      const std::string command = debug ? std::get<agent::DebugAction>(action.value()).command
                                        : std::get<agent::BashAction>(action.value()).command;
      attempt.state = debug ? AttemptState::Debugging : AttemptState::Exploring;
      attempt.turns += 1;
      attempt.tokens += tokens;

      auto ran = debug ? run_debug(task, main.get(), command, deadline, cancel)
                       : run_command(task, main.get(), security::ExecutionMode::Bash, command,
                                     deadline, cancel);
      if (!ran.ok()) {
        fault(ran.error());
        return;
      }
      auto &turn = ran.value();
      entry.turn = attempt.turns;
      entry.kind = debug ? "debug" : "bash";
      entry.stdout_text = turn.stdout_text;
      entry.stderr_text = turn.stderr_text;
      entry.exit_code = turn.exit_code;
      entry.timed_out = turn.timed_out;
      entry.denied_rule = turn.denied_rule;
      entry.duration = turn.duration;
      output = agent::TurnOutput{.cwd = turn.cwd,
                                 .stdout_text = std::move(turn.stdout_text),
                                 .stderr_text = std::move(turn.stderr_text)};
    }

    observability::record_metric(observability::TokensUsedMetric{.tokens = tokens});
    emit_turn(task.instance_id, attempt.index, entry);
    attempt.transcript.push_back(std::move(entry));

    if (interrupted()) {
      return;
    }
    if (attempt.turns >= run_.max_turns) {
      finish(attempt, AttemptOutcome::NoPatch, "turn limit reached without a patch");
      return;
    }
    reply = channel_.exchange(output, deadline, cancel);
  }
}

common::Result<InteractionStateMachine::TurnResult>
InteractionStateMachine::run_debug(const task::Task &task, const sandbox::Sandbox &main,
                                   const std::string &command, const common::Deadline &deadline,
                                   const common::CancellationToken &cancel) {
  auto snapshot = manager_.snapshot(main);
  if (!snapshot.ok()) {
    return common::Result<TurnResult>::failure(snapshot.error());
  }
  sandbox::ScopedSandbox ephemeral(manager_, std::move(snapshot.value()));
  auto ran = run_command(task, ephemeral.get(), security::ExecutionMode::Debug, command, deadline,
                         cancel);
  if (auto released = ephemeral.release(); !released.ok()) {
    observability::record_error("harness", released.error());
  }
  if (ran.ok()) {
    // Directory changes inside a snapshot die with it.
    ran.value().cwd = main.working_dir.string();
  }
  return ran;
}

common::Result<InteractionStateMachine::TurnResult>
InteractionStateMachine::run_command(const task::Task &task, sandbox::Sandbox &sandbox,
                                     const security::ExecutionMode mode,
                                     const std::string &command, const common::Deadline &deadline,
                                     const common::CancellationToken &cancel) const {
  const security::PolicyScope scope{
      .mode = mode,
      .repo_root = sandbox.root,
      .working_dir = sandbox.working_dir,
      .writable_root = mode == security::ExecutionMode::Debug ? sandbox.root
                                                              : std::filesystem::path{},
  };
  const auto decision = policy_.evaluate(command, scope, task);
  if (!decision.allowed) {
    observability::record_event(observability::PolicyDenialEvent{
        .instance_id = task.instance_id,
        .rule = std::string(security::policy_rule_name(decision.rule)),
        .reason = decision.reason,
    });
    TurnResult denied;
    denied.stderr_text = decision.denial_text();
    denied.exit_code = security::POLICY_DENIED_EXIT_CODE;
    denied.denied_rule = std::string(security::policy_rule_name(decision.rule));
    denied.cwd = sandbox.working_dir.string();
    return common::Result<TurnResult>::success(std::move(denied));
  }

  auto executed = manager_.execute(
      sandbox, command, deadline.clamp(std::chrono::seconds(run_.bash_timeout_secs)), cancel);
  if (!executed.ok()) {
    return common::Result<TurnResult>::failure(executed.error());
  }
  auto &result = executed.value();
  TurnResult turn;
  turn.stdout_text = std::move(result.stdout_text);
  turn.stderr_text = std::move(result.stderr_text);
  turn.exit_code = result.exit_code;
  turn.timed_out = result.timed_out;
  turn.cwd = result.working_dir.string();
  turn.duration = result.duration;
  return common::Result<TurnResult>::success(std::move(turn));
}

void InteractionStateMachine::finish(Attempt &attempt, const AttemptOutcome outcome,
                                     std::string error) const {
  attempt.outcome = outcome;
  attempt.state = terminal_state(outcome);
  attempt.error = std::move(error);
}

} // namespace sweguard::harness
