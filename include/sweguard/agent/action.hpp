#pragma once

#include "sweguard/agent/protocol.hpp"
#include "sweguard/common/result.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace sweguard::agent {

/// Read-only exploration in the persistent workspace.
struct BashAction {
  std::string command;
};

/// Experiment in a throwaway writable copy of the workspace.
struct DebugAction {
  std::string command;
};

/// Final unified diff submitted for validation.
struct PatchAction {
  std::string diff;
};

using Action = std::variant<BashAction, DebugAction, PatchAction>;

[[nodiscard]] std::string_view action_kind(const Action &action);

/// Rejects unknown tags and empty commands. A patch may be empty; the validator reports it.
[[nodiscard]] common::Result<Action> to_action(const InboundMessage &message);

} // namespace sweguard::agent
