#pragma once

#include "sweguard/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sweguard::agent {

/// First message of an attempt.
struct SessionStart {
  std::string cwd;
  std::string problem_statement;
  std::string hints_text;
  std::string runtime_version;
  std::vector<std::string> fail_to_pass;
};

/// What the agent sees after each action.
struct TurnOutput {
  std::string cwd;
  std::string stdout_text;
  std::string stderr_text;
};

struct InboundMessage {
  std::string action;
  std::string content;
  std::optional<std::uint64_t> total_tokens;

  /// Reported usage, or an estimate from the content length when the agent sent none.
  [[nodiscard]] std::uint64_t tokens() const;
};

/// Final notification once an attempt is terminal.
struct AttemptReport {
  std::string instance_id;
  std::uint32_t attempt = 0;
  std::string outcome;
  std::uint32_t turns = 0;
  std::uint64_t tokens = 0;
};

/// ceil(len / 4).
[[nodiscard]] std::uint64_t estimate_tokens(const std::string &content);

[[nodiscard]] std::string encode_session_start(const std::string &session_id,
                                               const SessionStart &start);
[[nodiscard]] std::string encode_turn_output(const std::string &session_id,
                                             const TurnOutput &output);
[[nodiscard]] std::string encode_attempt_report(const std::string &session_id,
                                                const AttemptReport &report);

/// Parses `{"action", "content", "usage": {"total_tokens"}}`. Only the shape is checked
/// here; the action tag is interpreted by `to_action`.
[[nodiscard]] common::Result<InboundMessage> decode_inbound(const std::string &json);

} // namespace sweguard::agent
