#pragma once

#include "sweguard/config/schema.hpp"
#include "sweguard/task/task.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sweguard::security {

enum class ExecutionMode { Bash, Debug };

[[nodiscard]] std::string_view execution_mode_name(ExecutionMode mode);

/// Coordinates the policy reasons about. All paths are in sandbox coordinates.
struct PolicyScope {
  ExecutionMode mode = ExecutionMode::Bash;
  std::filesystem::path repo_root;
  std::filesystem::path working_dir;
  /// Only meaningful in debug mode: the root of the writable snapshot.
  std::filesystem::path writable_root;
};

enum class PolicyRule {
  None,
  Malformed,
  PathContainment,
  SystemPath,
  AncestryCeiling,
  TestFileImmutable,
  ModeWrite,
};

[[nodiscard]] std::string_view policy_rule_name(PolicyRule rule);

struct PolicyDecision {
  bool allowed = true;
  PolicyRule rule = PolicyRule::None;
  std::string reason;

  static PolicyDecision allow() { return PolicyDecision{}; }
  static PolicyDecision deny(PolicyRule rule, std::string reason) {
    return PolicyDecision{.allowed = false, .rule = rule, .reason = std::move(reason)};
  }

  /// Message handed back to the agent as the turn's stderr.
  [[nodiscard]] std::string denial_text() const;
};

/// Exit code reported for a command the policy refused to run.
constexpr int POLICY_DENIED_EXIT_CODE = 126;

extern const std::array<const char *, 10> SYSTEM_DENY_PATHS;

class SecurityPolicy {
public:
  SecurityPolicy();
  explicit SecurityPolicy(const config::PolicyConfig &config);

  /// Decides whether `command` may run. Pure: only lexical path arithmetic, no filesystem
  /// access, so identical inputs always give identical decisions.
  [[nodiscard]] PolicyDecision evaluate(const std::string &command, const PolicyScope &scope,
                                        const task::Task &task) const;

  [[nodiscard]] const std::vector<std::filesystem::path> &deny_paths() const {
    return deny_paths_;
  }

private:
  std::vector<std::filesystem::path> deny_paths_;
  std::vector<std::filesystem::path> device_paths_;
};

} // namespace sweguard::security
