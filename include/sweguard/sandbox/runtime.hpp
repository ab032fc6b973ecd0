#pragma once

#include "sweguard/common/cancellation.hpp"
#include "sweguard/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sweguard::sandbox {

/// What a runtime needs to address one sandbox. `root` is the repository root in the
/// sandbox's own coordinates; `container` and `image` are empty for the local runtime.
struct RuntimeHandle {
  std::string id;
  std::filesystem::path root;
  std::string container;
  std::string image;
};

struct CloneRequest {
  std::string sandbox_id;
  std::string repo;
  std::string repo_url;
  std::string base_commit;
  std::string environment_setup_commit;
  std::string runtime_version;
  std::vector<std::string> setup_commands;
  std::chrono::milliseconds clone_timeout{300'000};
  std::chrono::milliseconds setup_timeout{600'000};
  common::CancellationToken cancel;
};

struct CloneOutcome {
  RuntimeHandle handle;
  /// Setup commands that failed; provisioning continues without them.
  std::vector<std::string> setup_warnings;
};

struct ExecRequest {
  std::string command;
  std::filesystem::path workdir;
  std::chrono::milliseconds timeout{30'000};
  std::string stdin_data;
  std::vector<std::pair<std::string, std::string>> env;
  common::CancellationToken cancel;
};

struct ExecResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
  bool timed_out = false;
  std::chrono::milliseconds duration{0};
};

class ISandboxRuntime {
public:
  virtual ~ISandboxRuntime() = default;

  /// Clones the repository, runs the setup commands and prunes history past the base
  /// commit. The returned tree is writable.
  [[nodiscard]] virtual common::Result<CloneOutcome> clone_repository(const CloneRequest &request) = 0;
  [[nodiscard]] virtual common::Status set_read_only(const RuntimeHandle &handle,
                                                     bool read_only) = 0;
  /// Runs `bash -c command`. A timeout is not a failure: the result carries `timed_out`.
  [[nodiscard]] virtual common::Result<ExecResult> execute(const RuntimeHandle &handle,
                                                           const ExecRequest &request) = 0;
  /// Independent writable copy of `source` addressed by `sandbox_id`.
  [[nodiscard]] virtual common::Result<RuntimeHandle> snapshot(const RuntimeHandle &source,
                                                               const std::string &sandbox_id) = 0;
  [[nodiscard]] virtual common::Status destroy(const RuntimeHandle &handle) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Clone into the current directory and check out the environment setup commit.
[[nodiscard]] std::string clone_script(const CloneRequest &request);

/// Detach at the base commit, then delete every ref, remote and reflog entry and drop
/// unreachable objects so later history cannot be recovered.
[[nodiscard]] std::string prune_history_script(const std::string &base_commit);

/// chmod script for `root`. With an `owner`, a writable tree is handed to that account and
/// a read-only one back to root.
[[nodiscard]] std::string read_only_script(const std::filesystem::path &root, bool read_only,
                                           const std::string &owner = "");

/// Replaces `{repo}` in a URL template.
[[nodiscard]] std::string render_repo_url(const std::string &url_template, const std::string &repo);

/// Exit codes coreutils `timeout` uses for an expired command.
[[nodiscard]] bool is_timeout_exit(int exit_code);

} // namespace sweguard::sandbox
