#pragma once

#include "sweguard/common/cancellation.hpp"
#include "sweguard/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace sweguard::sandbox {

struct Credentials {
  uid_t uid = 0;
  gid_t gid = 0;
};

struct ProcessOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
  std::filesystem::path cwd;
  std::vector<std::pair<std::string, std::string>> env;
  std::string stdin_data;
  common::CancellationToken cancel;
  /// Identity the child switches to before exec; requires a privileged parent.
  std::optional<Credentials> run_as;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool cancelled = false;
  std::chrono::milliseconds duration{0};
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /// Runs argv[0] from PATH. Unless `allow_failure` is set, a non-zero exit or a timeout
  /// is reported as a failure carrying stderr.
  [[nodiscard]] virtual common::Result<ProcessResult>
  run(const std::vector<std::string> &argv, const ProcessOptions &options = {}) = 0;
};

/// fork/exec runner. The child gets its own process group so a timeout or cancellation
/// kills everything it started.
class PosixProcessRunner final : public IProcessRunner {
public:
  PosixProcessRunner();

  [[nodiscard]] common::Result<ProcessResult>
  run(const std::vector<std::string> &argv, const ProcessOptions &options = {}) override;
};

[[nodiscard]] std::string join_args(const std::vector<std::string> &args);

/// Looks up a user name, or accepts a numeric uid (its gid is taken to match).
[[nodiscard]] common::Result<Credentials> resolve_credentials(const std::string &user);

} // namespace sweguard::sandbox
