#include "sweguard/sandbox/docker_runtime.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/observability/global.hpp"

#include <sstream>

namespace sweguard::sandbox {

namespace {

constexpr auto DOCKER_COMMAND_TIMEOUT = std::chrono::milliseconds(60'000);
constexpr auto IMAGE_BUILD_TIMEOUT = std::chrono::milliseconds(1'800'000);
constexpr auto EXEC_GRACE = std::chrono::milliseconds(5'000);

std::string seconds_arg(const std::chrono::milliseconds timeout) {
  const auto secs = (timeout.count() + 999) / 1000;
  return std::to_string(secs < 1 ? 1 : secs);
}

std::string format_cpus(const double cpus) {
  std::ostringstream out;
  out << cpus;
  return out.str();
}

bool is_daemon_error(const ProcessResult &result) {
  return common::starts_with(result.stderr_text, "Error response from daemon") ||
         common::starts_with(result.stderr_text, "Error: No such container") ||
         common::starts_with(result.stderr_text, "Cannot connect to the Docker daemon");
}

} // namespace

std::string docker_safe_name(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : common::to_lower(value)) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '.' || ch == '_' ||
        ch == '-') {
      out.push_back(ch);
    } else {
      out.push_back('-');
    }
  }
  while (!out.empty() && (out.front() == '-' || out.front() == '.')) {
    out.erase(out.begin());
  }
  if (out.size() > 100) {
    out.resize(100);
  }
  return out.empty() ? "sandbox" : out;
}

DockerRuntime::DockerRuntime(config::SandboxConfig config, std::shared_ptr<IProcessRunner> runner)
    : config_(std::move(config)), runner_(std::move(runner)) {}

std::string DockerRuntime::image_for(const std::string &runtime_version) const {
  return config_.image + ":" + (runtime_version.empty() ? "latest" : runtime_version);
}

std::string DockerRuntime::container_name(const std::string &sandbox_id) const {
  return config_.container_prefix + docker_safe_name(sandbox_id);
}

std::vector<std::string> DockerRuntime::build_run_args(const std::string &container,
                                                       const std::string &image,
                                                       const bool network) const {
  std::vector<std::string> args = {"run", "-d", "--name", container};
  if (!config_.memory_limit.empty()) {
    args.emplace_back("--memory");
    args.push_back(config_.memory_limit);
  }
  if (config_.cpu_limit > 0.0) {
    args.emplace_back("--cpus");
    args.push_back(format_cpus(config_.cpu_limit));
  }
  args.emplace_back("--network");
  args.push_back(network ? config_.network_mode : "none");
  args.emplace_back("-w");
  args.push_back(std::filesystem::path(config_.repo_root).parent_path().string());
  args.push_back(image);
  args.emplace_back("tail");
  args.emplace_back("-f");
  args.emplace_back("/dev/null");
  return args;
}

std::vector<std::string> DockerRuntime::build_exec_args(const RuntimeHandle &handle,
                                                        const ExecRequest &request,
                                                        const bool privileged) const {
  std::vector<std::string> args = {"exec"};
  if (!request.stdin_data.empty()) {
    args.emplace_back("-i");
  }
  if (!privileged) {
    args.emplace_back("--user");
    args.push_back(config_.user);
  }
  args.emplace_back("-w");
  args.push_back(request.workdir.empty() ? handle.root.string() : request.workdir.string());
  for (const auto &[key, value] : request.env) {
    args.emplace_back("-e");
    args.push_back(key + "=" + value);
  }
  args.push_back(handle.container);
  args.emplace_back("timeout");
  args.emplace_back("-k");
  args.emplace_back("1");
  args.push_back(seconds_arg(request.timeout));
  args.emplace_back("bash");
  args.emplace_back("-c");
  args.push_back(request.command);
  return args;
}

common::Result<ProcessResult> DockerRuntime::docker(std::vector<std::string> args,
                                                    ProcessOptions options) {
  args.insert(args.begin(), "docker");
  return runner_->run(args, options);
}

common::Status DockerRuntime::ensure_image(const std::string &image,
                                           const std::string &runtime_version) {
  std::lock_guard<std::mutex> lock(image_mutex_);
  const auto inspect = docker({"image", "inspect", image},
                              ProcessOptions{.allow_failure = true,
                                             .timeout = DOCKER_COMMAND_TIMEOUT});
  if (!inspect.ok()) {
    return common::Status::error(inspect.error());
  }
  if (inspect.value().exit_code == 0) {
    return common::Status::success();
  }
  if (config_.dockerfile.empty()) {
    return common::Status::error("image " + image + " not found and sandbox.dockerfile is not set");
  }

  const std::filesystem::path dockerfile(config_.dockerfile);
  const auto context = dockerfile.parent_path().empty() ? std::filesystem::path(".")
                                                        : dockerfile.parent_path();
  const auto built = docker({"build", "-f", dockerfile.string(), "--build-arg",
                             "PYTHON_VERSION=" + runtime_version, "-t", image, context.string()},
                            ProcessOptions{.timeout = IMAGE_BUILD_TIMEOUT});
  if (!built.ok()) {
    return common::Status::error("image build failed for " + image + ": " + built.error());
  }
  return common::Status::success();
}

common::Result<ProcessResult>
DockerRuntime::exec_script(const RuntimeHandle &handle, const std::string &script,
                           const std::filesystem::path &workdir,
                           const std::chrono::milliseconds timeout,
                           const common::CancellationToken &cancel) {
  const auto args = build_exec_args(handle, ExecRequest{.command = script,
                                                        .workdir = workdir,
                                                        .timeout = timeout,
                                                        .stdin_data = "",
                                                        .env = {},
                                                        .cancel = cancel},
                                    true);
  return docker(args, ProcessOptions{.allow_failure = true,
                                     .timeout = timeout + EXEC_GRACE,
                                     .cwd = {},
                                     .env = {},
                                     .stdin_data = "",
                                     .cancel = cancel});
}

common::Result<CloneOutcome> DockerRuntime::clone_repository(const CloneRequest &request) {
  const std::string image = image_for(request.runtime_version);
  if (auto status = ensure_image(image, request.runtime_version); !status.ok()) {
    return common::Result<CloneOutcome>::failure(status.error());
  }

  CloneOutcome outcome;
  outcome.handle = RuntimeHandle{.id = request.sandbox_id,
                                 .root = config_.repo_root,
                                 .container = container_name(request.sandbox_id),
                                 .image = ""};
  const auto started = docker(build_run_args(outcome.handle.container, image, true),
                              ProcessOptions{.timeout = DOCKER_COMMAND_TIMEOUT});
  if (!started.ok()) {
    return common::Result<CloneOutcome>::failure("failed to start container: " + started.error());
  }

  auto abort = [&](const std::string &message) {
    if (auto status = destroy(outcome.handle); !status.ok()) {
      observability::record_warning("sandbox", status.error());
    }
    return common::Result<CloneOutcome>::failure(message);
  };

  const auto root = outcome.handle.root;
  const auto prepared =
      exec_script(outcome.handle, "mkdir -p " + common::shell_quote(root.string()), "/",
                  DOCKER_COMMAND_TIMEOUT, request.cancel);
  if (!prepared.ok() || prepared.value().exit_code != 0) {
    return abort("unable to create repository root " + root.string());
  }

  const auto cloned =
      exec_script(outcome.handle, clone_script(request), root, request.clone_timeout, request.cancel);
  if (!cloned.ok()) {
    return abort("clone failed: " + cloned.error());
  }
  if (cloned.value().exit_code != 0) {
    return abort("clone failed: " + common::trim(cloned.value().stderr_text));
  }

  for (const auto &command : request.setup_commands) {
    const auto setup =
        exec_script(outcome.handle, command, root, request.setup_timeout, request.cancel);
    if (setup.ok() && setup.value().exit_code == 0) {
      break;
    }
    outcome.setup_warnings.push_back(command + ": " +
                                     (setup.ok() ? common::trim(setup.value().stderr_text)
                                                 : setup.error()));
  }
  if (request.cancel.is_cancelled()) {
    return abort("cancelled");
  }

  const auto pruned = exec_script(outcome.handle, prune_history_script(request.base_commit), root,
                                  request.clone_timeout, request.cancel);
  if (!pruned.ok() || pruned.value().exit_code != 0) {
    return abort("checkout of base commit failed: " +
                 (pruned.ok() ? common::trim(pruned.value().stderr_text) : pruned.error()));
  }

  const auto owned = exec_script(outcome.handle, read_only_script(root, false, config_.user), "/",
                                 DOCKER_COMMAND_TIMEOUT, request.cancel);
  if (!owned.ok() || owned.value().exit_code != 0) {
    return abort("unable to hand the repository to " + config_.user + ": " +
                 (owned.ok() ? common::trim(owned.value().stderr_text) : owned.error()));
  }

  if (config_.isolate_network && config_.network_mode != "none") {
    const auto disconnected =
        docker({"network", "disconnect", "-f", config_.network_mode, outcome.handle.container},
               ProcessOptions{.timeout = DOCKER_COMMAND_TIMEOUT});
    if (!disconnected.ok()) {
      return abort("network isolation failed: " + disconnected.error());
    }
  }

  return common::Result<CloneOutcome>::success(std::move(outcome));
}

common::Status DockerRuntime::set_read_only(const RuntimeHandle &handle, const bool read_only) {
  const auto result =
      exec_script(handle, read_only_script(handle.root, read_only, config_.user), "/",
                  DOCKER_COMMAND_TIMEOUT, common::CancellationToken{});
  if (!result.ok()) {
    return common::Status::error(result.error());
  }
  if (result.value().exit_code != 0) {
    return common::Status::error("permission change failed: " +
                                 common::trim(result.value().stderr_text));
  }
  return common::Status::success();
}

common::Result<ExecResult> DockerRuntime::execute(const RuntimeHandle &handle,
                                                  const ExecRequest &request) {
  auto ran = docker(build_exec_args(handle, request),
                    ProcessOptions{.allow_failure = true,
                                   .timeout = request.timeout + EXEC_GRACE,
                                   .cwd = {},
                                   .env = {},
                                   .stdin_data = request.stdin_data,
                                   .cancel = request.cancel});
  if (!ran.ok()) {
    return common::Result<ExecResult>::failure(ran.error());
  }
  auto &process = ran.value();
  if (is_daemon_error(process)) {
    return common::Result<ExecResult>::failure("docker exec failed: " +
                                               common::trim(process.stderr_text));
  }

  ExecResult result;
  result.exit_code = process.exit_code;
  result.duration = process.duration;
  result.timed_out = process.timed_out || process.exit_code == 124 ||
                     (process.exit_code == 137 && process.duration >= request.timeout);
  result.stdout_text = std::move(process.stdout_text);
  result.stderr_text = std::move(process.stderr_text);
  return common::Result<ExecResult>::success(std::move(result));
}

common::Result<RuntimeHandle> DockerRuntime::snapshot(const RuntimeHandle &source,
                                                      const std::string &sandbox_id) {
  RuntimeHandle handle{.id = sandbox_id,
                       .root = source.root,
                       .container = container_name(sandbox_id),
                       .image = config_.container_prefix + "snapshot-" +
                                docker_safe_name(sandbox_id)};
  const auto committed = docker({"commit", source.container, handle.image},
                                ProcessOptions{.timeout = DOCKER_COMMAND_TIMEOUT});
  if (!committed.ok()) {
    return common::Result<RuntimeHandle>::failure("snapshot commit failed: " + committed.error());
  }

  const auto started = docker(build_run_args(handle.container, handle.image, false),
                              ProcessOptions{.timeout = DOCKER_COMMAND_TIMEOUT});
  if (!started.ok()) {
    (void)docker({"rmi", "-f", handle.image},
                 ProcessOptions{.allow_failure = true, .timeout = DOCKER_COMMAND_TIMEOUT});
    return common::Result<RuntimeHandle>::failure("snapshot start failed: " + started.error());
  }
  if (auto writable = set_read_only(handle, false); !writable.ok()) {
    if (auto status = destroy(handle); !status.ok()) {
      observability::record_warning("sandbox", status.error());
    }
    return common::Result<RuntimeHandle>::failure("snapshot is not writable: " + writable.error());
  }
  return common::Result<RuntimeHandle>::success(std::move(handle));
}

common::Status DockerRuntime::destroy(const RuntimeHandle &handle) {
  const auto removed = docker({"rm", "-f", handle.container},
                              ProcessOptions{.allow_failure = true,
                                             .timeout = DOCKER_COMMAND_TIMEOUT});
  if (!removed.ok()) {
    return common::Status::error(removed.error());
  }
  if (removed.value().exit_code != 0 &&
      removed.value().stderr_text.find("No such container") == std::string::npos) {
    return common::Status::error("failed to remove container " + handle.container + ": " +
                                 common::trim(removed.value().stderr_text));
  }

  if (!handle.image.empty()) {
    const auto image_removed = docker(
        {"rmi", "-f", handle.image},
        ProcessOptions{.allow_failure = true, .timeout = DOCKER_COMMAND_TIMEOUT});
    if (!image_removed.ok()) {
      return common::Status::error(image_removed.error());
    }
  }
  return common::Status::success();
}

} // namespace sweguard::sandbox
