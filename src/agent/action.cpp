#include "sweguard/agent/action.hpp"

#include "sweguard/common/fs.hpp"

namespace sweguard::agent {

std::string_view action_kind(const Action &action) {
  if (std::holds_alternative<BashAction>(action)) {
    return "bash";
  }
  if (std::holds_alternative<DebugAction>(action)) {
    return "debug";
  }
  return "patch";
}

common::Result<Action> to_action(const InboundMessage &message) {
  const std::string tag = common::to_lower(common::trim(message.action));
  if (tag.empty()) {
    return common::Result<Action>::failure("protocol error: reply has no action");
  }

  if (tag == "bash" || tag == "debug") {
    if (common::trim(message.content).empty()) {
      return common::Result<Action>::failure("protocol error: empty " + tag + " command");
    }
    if (tag == "bash") {
      return common::Result<Action>::success(BashAction{.command = message.content});
    }
    return common::Result<Action>::success(DebugAction{.command = message.content});
  }
  if (tag == "patch") {
    return common::Result<Action>::success(PatchAction{.diff = message.content});
  }
  return common::Result<Action>::failure("protocol error: unknown action '" + message.action +
                                         "' (expected bash, debug or patch)");
}

} // namespace sweguard::agent
