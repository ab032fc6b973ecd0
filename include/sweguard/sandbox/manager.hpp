#pragma once

#include "sweguard/common/cancellation.hpp"
#include "sweguard/common/result.hpp"
#include "sweguard/config/schema.hpp"
#include "sweguard/sandbox/runtime.hpp"
#include "sweguard/task/task.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace sweguard::sandbox {

enum class SandboxKind { Main, Ephemeral, Validation };

[[nodiscard]] std::string_view sandbox_kind_name(SandboxKind kind);

struct Sandbox {
  std::string id;
  SandboxKind kind = SandboxKind::Main;
  std::filesystem::path root;
  bool writable = false;
  std::string created_at;
  std::string ancestry_ceiling;
  std::filesystem::path working_dir;
  RuntimeHandle handle;
};

struct CommandResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
  std::filesystem::path working_dir;
  bool timed_out = false;
};

/// Marker line the execution trailer writes before the final working directory.
inline constexpr const char *PWD_MARKER = "__SWEGUARD_PWD__:";

class SandboxManager {
public:
  SandboxManager(config::SandboxConfig config, std::shared_ptr<ISandboxRuntime> runtime);

  SandboxManager(const SandboxManager &) = delete;
  SandboxManager &operator=(const SandboxManager &) = delete;

  /// Fresh checkout at the task's base commit with history pruned, made read-only.
  [[nodiscard]] common::Result<Sandbox> provision_main(const task::Task &task,
                                                       const common::CancellationToken &cancel = {});
  /// Same checkout, left writable, for patch validation.
  [[nodiscard]] common::Result<Sandbox>
  provision_validation(const task::Task &task, const common::CancellationToken &cancel = {});
  /// Independent writable copy of `main`, starting in the same relative directory.
  [[nodiscard]] common::Result<Sandbox> snapshot(const Sandbox &main);

  /// Runs `command` under bash from the sandbox's working directory and tracks `cd`.
  /// Output is capped at the configured limits unless `full_output` is set.
  /// A failure means the substrate could not run the command at all.
  [[nodiscard]] common::Result<CommandResult> execute(Sandbox &sandbox, const std::string &command,
                                                      std::chrono::milliseconds timeout,
                                                      const common::CancellationToken &cancel,
                                                      const std::string &stdin_data = "",
                                                      bool full_output = false);

  /// Idempotent: destroying a sandbox that is no longer live succeeds without effect.
  [[nodiscard]] common::Status destroy(Sandbox &sandbox);

  [[nodiscard]] std::size_t live_count() const;
  [[nodiscard]] bool is_live(const std::string &sandbox_id) const;
  [[nodiscard]] const config::SandboxConfig &config() const { return config_; }
  [[nodiscard]] std::string_view runtime_name() const { return runtime_->name(); }

private:
  [[nodiscard]] common::Result<Sandbox> provision(const task::Task &task, SandboxKind kind,
                                                  const common::CancellationToken &cancel);
  [[nodiscard]] std::string next_id(const std::string &instance_id, SandboxKind kind);
  void register_sandbox(const Sandbox &sandbox);
  void publish_live_count() const;

  config::SandboxConfig config_;
  std::shared_ptr<ISandboxRuntime> runtime_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, RuntimeHandle> live_;
  std::atomic<std::uint64_t> sequence_{0};
};

/// Destroys its sandbox when it goes out of scope. Destroy failures are reported to the
/// observer, never thrown.
class ScopedSandbox {
public:
  ScopedSandbox(SandboxManager &manager, Sandbox sandbox);
  ~ScopedSandbox();

  ScopedSandbox(const ScopedSandbox &) = delete;
  ScopedSandbox &operator=(const ScopedSandbox &) = delete;
  ScopedSandbox(ScopedSandbox &&other) noexcept;
  ScopedSandbox &operator=(ScopedSandbox &&other) = delete;

  [[nodiscard]] Sandbox &get() { return *sandbox_; }
  [[nodiscard]] const Sandbox &get() const { return *sandbox_; }
  Sandbox *operator->() { return &*sandbox_; }

  /// Destroys now and reports the outcome.
  [[nodiscard]] common::Status release();

private:
  SandboxManager *manager_;
  std::optional<Sandbox> sandbox_;
};

/// Splits the execution trailer off `stderr_text`, returning the reported directory.
[[nodiscard]] std::optional<std::filesystem::path> strip_pwd_trailer(std::string &stderr_text);

} // namespace sweguard::sandbox
