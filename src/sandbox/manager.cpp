#include "sweguard/sandbox/manager.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/common/hash.hpp"
#include "sweguard/observability/global.hpp"

namespace sweguard::sandbox {

namespace {

std::string wrap_with_trailer(const std::string &command) {
  return std::string("trap '__sweguard_status=$?; printf \"\\n%s%s\\n\" \"") + PWD_MARKER +
         "\" \"$(pwd)\" >&2; exit $__sweguard_status' EXIT\n" + command + "\n";
}

std::string timeout_note(const std::chrono::milliseconds timeout) {
  return "Command timed out after " + std::to_string((timeout.count() + 999) / 1000) + "s";
}

} // namespace

std::string_view sandbox_kind_name(const SandboxKind kind) {
  switch (kind) {
  case SandboxKind::Main:
    return "main";
  case SandboxKind::Ephemeral:
    return "ephemeral";
  case SandboxKind::Validation:
    return "validation";
  }
  return "main";
}

std::optional<std::filesystem::path> strip_pwd_trailer(std::string &stderr_text) {
  const std::string marker = std::string("\n") + PWD_MARKER;
  const auto pos = stderr_text.rfind(marker);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  const auto start = pos + marker.size();
  auto end = stderr_text.find('\n', start);
  if (end == std::string::npos) {
    end = stderr_text.size();
  }
  std::filesystem::path directory(stderr_text.substr(start, end - start));
  std::string rest = end < stderr_text.size() ? stderr_text.substr(end + 1) : "";
  stderr_text = stderr_text.substr(0, pos) + rest;
  if (directory.empty()) {
    return std::nullopt;
  }
  return directory;
}

SandboxManager::SandboxManager(config::SandboxConfig config,
                               std::shared_ptr<ISandboxRuntime> runtime)
    : config_(std::move(config)), runtime_(std::move(runtime)) {}

std::string SandboxManager::next_id(const std::string &instance_id, const SandboxKind kind) {
  const auto sequence = sequence_.fetch_add(1);
  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::string digest = common::sha256_hex(instance_id + "#" + std::to_string(sequence) +
                                                "#" + std::to_string(nonce));
  return instance_id + "-" + std::string(sandbox_kind_name(kind)) + "-" + digest.substr(0, 10);
}

void SandboxManager::register_sandbox(const Sandbox &sandbox) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    live_[sandbox.id] = sandbox.handle;
  }
  observability::record_sandbox(sandbox.id, std::string(sandbox_kind_name(sandbox.kind)),
                                "ready");
  publish_live_count();
}

void SandboxManager::publish_live_count() const {
  observability::record_metric(observability::LiveSandboxesMetric{.count = live_count()});
}

std::size_t SandboxManager::live_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_.size();
}

bool SandboxManager::is_live(const std::string &sandbox_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_.contains(sandbox_id);
}

common::Result<Sandbox> SandboxManager::provision(const task::Task &task, const SandboxKind kind,
                                                  const common::CancellationToken &cancel) {
  const std::string id = next_id(task.instance_id, kind);
  const std::string kind_name(sandbox_kind_name(kind));
  observability::record_sandbox(id, kind_name, "provisioning");

  CloneRequest request{
      .sandbox_id = id,
      .repo = task.repo,
      .repo_url = render_repo_url(config_.repo_url_template, task.repo),
      .base_commit = task.base_commit,
      .environment_setup_commit = task.environment_setup_commit,
      .runtime_version = task.runtime_version,
      .setup_commands = config_.setup_commands,
      .clone_timeout = std::chrono::seconds(config_.clone_timeout_secs),
      .setup_timeout = std::chrono::seconds(config_.setup_timeout_secs),
      .cancel = cancel,
  };
  auto cloned = runtime_->clone_repository(request);
  if (!cloned.ok()) {
    observability::record_error("sandbox", id + ": " + cloned.error());
    return common::Result<Sandbox>::failure("provisioning failed: " + cloned.error());
  }
  for (const auto &warning : cloned.value().setup_warnings) {
    observability::record_warning("sandbox", id + ": setup command failed: " + warning);
  }

  Sandbox sandbox;
  sandbox.id = id;
  sandbox.kind = kind;
  sandbox.handle = std::move(cloned.value().handle);
  sandbox.root = sandbox.handle.root;
  sandbox.writable = kind != SandboxKind::Main;
  sandbox.created_at = common::now_rfc3339();
  sandbox.ancestry_ceiling = task.base_commit;
  sandbox.working_dir = sandbox.root;

  if (kind == SandboxKind::Main) {
    if (auto status = runtime_->set_read_only(sandbox.handle, true); !status.ok()) {
      if (auto destroyed = runtime_->destroy(sandbox.handle); !destroyed.ok()) {
        observability::record_error("sandbox", id + ": " + destroyed.error());
      }
      return common::Result<Sandbox>::failure("unable to make workspace read-only: " +
                                              status.error());
    }
  }

  register_sandbox(sandbox);
  return common::Result<Sandbox>::success(std::move(sandbox));
}

common::Result<Sandbox> SandboxManager::provision_main(const task::Task &task,
                                                       const common::CancellationToken &cancel) {
  return provision(task, SandboxKind::Main, cancel);
}

common::Result<Sandbox>
SandboxManager::provision_validation(const task::Task &task,
                                     const common::CancellationToken &cancel) {
  return provision(task, SandboxKind::Validation, cancel);
}

common::Result<Sandbox> SandboxManager::snapshot(const Sandbox &main) {
  if (!is_live(main.id)) {
    return common::Result<Sandbox>::failure("sandbox " + main.id + " is not live");
  }

  std::string base = main.id;
  if (const auto cut = base.rfind("-main-"); cut != std::string::npos) {
    base = base.substr(0, cut);
  }
  const std::string id = next_id(base, SandboxKind::Ephemeral);
  observability::record_sandbox(id, "ephemeral", "provisioning");

  auto handle = runtime_->snapshot(main.handle, id);
  if (!handle.ok()) {
    observability::record_error("sandbox", id + ": " + handle.error());
    return common::Result<Sandbox>::failure("snapshot failed: " + handle.error());
  }

  Sandbox sandbox;
  sandbox.id = id;
  sandbox.kind = SandboxKind::Ephemeral;
  sandbox.handle = std::move(handle.value());
  sandbox.root = sandbox.handle.root;
  sandbox.writable = true;
  sandbox.created_at = common::now_rfc3339();
  sandbox.ancestry_ceiling = main.ancestry_ceiling;
  const auto relative = main.working_dir.lexically_relative(main.root);
  sandbox.working_dir = common::resolve_lexically(sandbox.root, relative);

  register_sandbox(sandbox);
  return common::Result<Sandbox>::success(std::move(sandbox));
}

common::Result<CommandResult> SandboxManager::execute(Sandbox &sandbox, const std::string &command,
                                                      const std::chrono::milliseconds timeout,
                                                      const common::CancellationToken &cancel,
                                                      const std::string &stdin_data,
                                                      const bool full_output) {
  if (!is_live(sandbox.id)) {
    return common::Result<CommandResult>::failure("sandbox " + sandbox.id + " is not live");
  }

  ExecRequest request{
      .command = wrap_with_trailer(command),
      .workdir = sandbox.working_dir,
      .timeout = timeout,
      .stdin_data = stdin_data,
      .env = {{"HOME", sandbox.root.string()}, {"PAGER", "cat"}, {"GIT_PAGER", "cat"}},
      .cancel = cancel,
  };
  auto ran = runtime_->execute(sandbox.handle, request);
  if (!ran.ok()) {
    return common::Result<CommandResult>::failure(ran.error());
  }
  auto &exec = ran.value();

  CommandResult result;
  result.exit_code = exec.exit_code;
  result.duration = exec.duration;
  result.timed_out = exec.timed_out;

  if (const auto reported = strip_pwd_trailer(exec.stderr_text); reported.has_value()) {
    const auto directory = common::resolve_lexically(sandbox.root, *reported);
    if (common::is_subpath(directory, sandbox.root)) {
      sandbox.working_dir = directory;
    }
  }
  if (result.timed_out) {
    if (!exec.stderr_text.empty() && exec.stderr_text.back() != '\n') {
      exec.stderr_text.push_back('\n');
    }
    exec.stderr_text += timeout_note(timeout);
  }

  if (full_output) {
    result.stdout_text = std::move(exec.stdout_text);
    result.stderr_text = std::move(exec.stderr_text);
  } else {
    result.stdout_text = common::truncate_output(exec.stdout_text, config_.max_stdout_bytes);
    result.stderr_text = common::truncate_output(exec.stderr_text, config_.max_stderr_bytes);
  }
  result.working_dir = sandbox.working_dir;

  observability::record_metric(observability::CommandLatencyMetric{.latency = result.duration});
  return common::Result<CommandResult>::success(std::move(result));
}

common::Status SandboxManager::destroy(Sandbox &sandbox) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (live_.erase(sandbox.id) == 0) {
      return common::Status::success();
    }
  }

  const auto status = runtime_->destroy(sandbox.handle);
  observability::record_sandbox(sandbox.id, std::string(sandbox_kind_name(sandbox.kind)),
                                status.ok() ? "destroyed" : "destroy-failed");
  publish_live_count();
  if (!status.ok()) {
    return common::Status::error("destroy " + sandbox.id + ": " + status.error());
  }
  return common::Status::success();
}

ScopedSandbox::ScopedSandbox(SandboxManager &manager, Sandbox sandbox)
    : manager_(&manager), sandbox_(std::move(sandbox)) {}

ScopedSandbox::ScopedSandbox(ScopedSandbox &&other) noexcept
    : manager_(other.manager_), sandbox_(std::move(other.sandbox_)) {
  other.sandbox_.reset();
}

ScopedSandbox::~ScopedSandbox() {
  if (!sandbox_.has_value()) {
    return;
  }
  if (auto status = manager_->destroy(*sandbox_); !status.ok()) {
    observability::record_error("sandbox", status.error());
  }
}

common::Status ScopedSandbox::release() {
  if (!sandbox_.has_value()) {
    return common::Status::success();
  }
  auto status = manager_->destroy(*sandbox_);
  sandbox_.reset();
  return status;
}

} // namespace sweguard::sandbox
