#pragma once

#include "sweguard/config/schema.hpp"
#include "sweguard/sandbox/process.hpp"
#include "sweguard/sandbox/runtime.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace sweguard::sandbox {

/// Sandboxes as plain directories under `local_root`, commands as host processes.
/// Sandbox coordinates are host paths. Started as root, agent commands run as
/// `sandbox.user` and read-only trees belong to root.
class LocalRuntime final : public ISandboxRuntime {
public:
  explicit LocalRuntime(config::SandboxConfig config,
                        std::shared_ptr<IProcessRunner> runner =
                            std::make_shared<PosixProcessRunner>());

  [[nodiscard]] common::Result<CloneOutcome> clone_repository(const CloneRequest &request) override;
  [[nodiscard]] common::Status set_read_only(const RuntimeHandle &handle, bool read_only) override;
  [[nodiscard]] common::Result<ExecResult> execute(const RuntimeHandle &handle,
                                                   const ExecRequest &request) override;
  [[nodiscard]] common::Result<RuntimeHandle> snapshot(const RuntimeHandle &source,
                                                       const std::string &sandbox_id) override;
  [[nodiscard]] common::Status destroy(const RuntimeHandle &handle) override;
  [[nodiscard]] std::string_view name() const override { return "local"; }

  [[nodiscard]] const std::filesystem::path &root_dir() const { return root_dir_; }
  [[nodiscard]] std::filesystem::path sandbox_dir(const std::string &sandbox_id) const;
  /// Identity agent commands switch to; empty when not started as root.
  [[nodiscard]] const std::optional<Credentials> &run_as() const { return run_as_; }

private:
  [[nodiscard]] common::Result<ExecResult> run_script(const std::filesystem::path &workdir,
                                                      const std::string &script,
                                                      std::chrono::milliseconds timeout,
                                                      const common::CancellationToken &cancel);
  [[nodiscard]] common::Result<ExecResult> run_bash(const RuntimeHandle &handle,
                                                    const ExecRequest &request, bool privileged);
  /// Gives the tree to the sandbox user (writable) or back to root (read-only).
  [[nodiscard]] common::Status hand_over(const std::filesystem::path &root, bool to_sandbox_user);

  config::SandboxConfig config_;
  std::shared_ptr<IProcessRunner> runner_;
  std::filesystem::path root_dir_;
  std::optional<Credentials> run_as_;
  std::string run_as_error_;
};

/// Recursively sets `a-w,a+rX` (read-only) or `u+w` on `root`. Symlinks are not followed.
[[nodiscard]] common::Status set_tree_read_only(const std::filesystem::path &root, bool read_only);

/// lchown over `root` and everything below it.
[[nodiscard]] common::Status chown_tree(const std::filesystem::path &root,
                                        const Credentials &owner);

/// Copies `source` into `destination`, which must not exist, leaving the copy writable.
[[nodiscard]] common::Status copy_tree_writable(const std::filesystem::path &source,
                                                const std::filesystem::path &destination);

} // namespace sweguard::sandbox
