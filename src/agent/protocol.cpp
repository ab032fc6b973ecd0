#include "sweguard/agent/protocol.hpp"

#include "sweguard/common/json_util.hpp"

#include <sstream>

namespace sweguard::agent {

std::uint64_t InboundMessage::tokens() const {
  return total_tokens.has_value() ? *total_tokens : estimate_tokens(content);
}

std::uint64_t estimate_tokens(const std::string &content) {
  return (static_cast<std::uint64_t>(content.size()) + 3) / 4;
}

std::string encode_session_start(const std::string &session_id, const SessionStart &start) {
  std::ostringstream out;
  out << "{\"session_id\":" << common::json_quote(session_id) << ",\"kind\":\"start\""
      << ",\"cwd\":" << common::json_quote(start.cwd)
      << ",\"problem_statement\":" << common::json_quote(start.problem_statement)
      << ",\"hints_text\":" << common::json_quote(start.hints_text)
      << ",\"runtime_version\":" << common::json_quote(start.runtime_version)
      << ",\"fail_to_pass\":" << common::json_string_array(start.fail_to_pass) << "}";
  return out.str();
}

std::string encode_turn_output(const std::string &session_id, const TurnOutput &output) {
  std::ostringstream out;
  out << "{\"session_id\":" << common::json_quote(session_id) << ",\"kind\":\"result\""
      << ",\"cwd\":" << common::json_quote(output.cwd)
      << ",\"stdout\":" << common::json_quote(output.stdout_text)
      << ",\"stderr\":" << common::json_quote(output.stderr_text) << "}";
  return out.str();
}

std::string encode_attempt_report(const std::string &session_id, const AttemptReport &report) {
  std::ostringstream out;
  out << "{\"session_id\":" << common::json_quote(session_id) << ",\"kind\":\"end\""
      << ",\"instance_id\":" << common::json_quote(report.instance_id)
      << ",\"attempt\":" << report.attempt << ",\"outcome\":" << common::json_quote(report.outcome)
      << ",\"turns\":" << report.turns << ",\"tokens\":" << report.tokens << "}";
  return out.str();
}

common::Result<InboundMessage> decode_inbound(const std::string &json) {
  auto parsed = common::json_parse_object(json);
  if (!parsed.ok()) {
    return common::Result<InboundMessage>::failure("malformed agent reply: " + parsed.error());
  }
  const auto &fields = parsed.value();

  InboundMessage message;
  if (const auto it = fields.find("action"); it != fields.end() && it->second != "null") {
    message.action = it->second;
  }
  if (const auto it = fields.find("content"); it != fields.end() && it->second != "null") {
    message.content = it->second;
  }

  if (const auto it = fields.find("usage"); it != fields.end() && it->second != "null") {
    auto usage = common::json_parse_object(it->second);
    if (!usage.ok()) {
      return common::Result<InboundMessage>::failure("malformed usage in agent reply: " +
                                                     usage.error());
    }
    if (const auto total = usage.value().find("total_tokens"); total != usage.value().end()) {
      std::uint64_t tokens = 0;
      if (!common::json_parse_u64(total->second, tokens)) {
        return common::Result<InboundMessage>::failure("usage.total_tokens is not a count");
      }
      message.total_tokens = tokens;
    }
  }
  return common::Result<InboundMessage>::success(std::move(message));
}

} // namespace sweguard::agent
