#include "sweguard/sandbox/local_runtime.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/sandbox/docker_runtime.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace sweguard::sandbox {

namespace fs = std::filesystem;

namespace {

constexpr fs::perms WRITE_BITS =
    fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write;
constexpr fs::perms READ_BITS =
    fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms EXEC_BITS =
    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;

common::Status apply_mode(const fs::path &path, const fs::file_status &status,
                          const bool read_only) {
  std::error_code ec;
  if (read_only) {
    fs::perms mode = (status.permissions() & ~WRITE_BITS) | READ_BITS;
    if (fs::is_directory(status) || (status.permissions() & EXEC_BITS) != fs::perms::none) {
      mode |= EXEC_BITS;
    }
    fs::permissions(path, mode, fs::perm_options::replace, ec);
  } else {
    fs::permissions(path, fs::perms::owner_write, fs::perm_options::add, ec);
  }
  if (ec) {
    return common::Status::error("chmod " + path.string() + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace

common::Status set_tree_read_only(const fs::path &root, const bool read_only) {
  std::error_code ec;
  const auto root_status = fs::symlink_status(root, ec);
  if (ec) {
    return common::Status::error("cannot stat " + root.string() + ": " + ec.message());
  }
  if (!read_only) {
    if (auto status = apply_mode(root, root_status, false); !status.ok()) {
      return status;
    }
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
  if (ec) {
    return common::Status::error("cannot walk " + root.string() + ": " + ec.message());
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      return common::Status::error("cannot walk " + root.string() + ": " + ec.message());
    }
    const auto status = it->symlink_status(ec);
    if (ec || fs::is_symlink(status)) {
      continue;
    }
    if (auto applied = apply_mode(it->path(), status, read_only); !applied.ok()) {
      return applied;
    }
  }
  if (ec) {
    return common::Status::error("cannot walk " + root.string() + ": " + ec.message());
  }

  if (read_only) {
    return apply_mode(root, root_status, true);
  }
  return common::Status::success();
}

common::Status chown_tree(const fs::path &root, const Credentials &owner) {
  auto change = [&](const fs::path &path) {
    if (lchown(path.c_str(), owner.uid, owner.gid) != 0) {
      return common::Status::error("chown " + path.string() + ": " + std::strerror(errno));
    }
    return common::Status::success();
  };
  if (auto status = change(root); !status.ok()) {
    return status;
  }

  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (auto status = change(it->path()); !status.ok()) {
      return status;
    }
  }
  if (ec) {
    return common::Status::error("cannot walk " + root.string() + ": " + ec.message());
  }
  return common::Status::success();
}

common::Status copy_tree_writable(const fs::path &source, const fs::path &destination) {
  std::error_code ec;
  if (fs::exists(destination, ec)) {
    return common::Status::error("snapshot destination already exists: " + destination.string());
  }
  fs::create_directories(destination, ec);
  if (ec) {
    return common::Status::error("cannot create " + destination.string() + ": " + ec.message());
  }

  fs::recursive_directory_iterator it(source, fs::directory_options::none, ec);
  if (ec) {
    return common::Status::error("cannot walk " + source.string() + ": " + ec.message());
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      return common::Status::error("cannot walk " + source.string() + ": " + ec.message());
    }
    const auto relative = it->path().lexically_relative(source);
    const auto target = destination / relative;
    const auto status = it->symlink_status(ec);
    if (ec) {
      return common::Status::error("cannot stat " + it->path().string() + ": " + ec.message());
    }

    if (fs::is_symlink(status)) {
      fs::copy_symlink(it->path(), target, ec);
    } else if (fs::is_directory(status)) {
      fs::create_directories(target, ec);
    } else if (fs::is_regular_file(status)) {
      fs::copy_file(it->path(), target, fs::copy_options::none, ec);
      if (!ec) {
        fs::permissions(target, status.permissions() | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
      }
    }
    if (ec) {
      return common::Status::error("cannot copy " + it->path().string() + ": " + ec.message());
    }
  }
  return common::Status::success();
}

LocalRuntime::LocalRuntime(config::SandboxConfig config, std::shared_ptr<IProcessRunner> runner)
    : config_(std::move(config)), runner_(std::move(runner)),
      root_dir_(common::resolve_lexically(fs::current_path(),
                                          common::expand_path(config_.local_root))) {
  if (geteuid() != 0) {
    return;
  }
  auto credentials = resolve_credentials(config_.user);
  if (!credentials.ok()) {
    run_as_error_ = "refusing to run sandbox commands as root: " + credentials.error();
  } else if (credentials.value().uid == 0) {
    run_as_error_ = "refusing to run sandbox commands as root: sandbox.user is " + config_.user;
  } else {
    run_as_ = credentials.value();
  }
}

fs::path LocalRuntime::sandbox_dir(const std::string &sandbox_id) const {
  return root_dir_ / docker_safe_name(sandbox_id);
}

common::Result<ExecResult> LocalRuntime::run_script(const fs::path &workdir,
                                                    const std::string &script,
                                                    const std::chrono::milliseconds timeout,
                                                    const common::CancellationToken &cancel) {
  RuntimeHandle handle{.id = "", .root = workdir, .container = "", .image = ""};
  return run_bash(handle,
                  ExecRequest{.command = script,
                              .workdir = workdir,
                              .timeout = timeout,
                              .stdin_data = "",
                              .env = {},
                              .cancel = cancel},
                  true);
}

common::Status LocalRuntime::hand_over(const fs::path &root, const bool to_sandbox_user) {
  if (!run_as_.has_value()) {
    return common::Status::success();
  }
  return chown_tree(root, to_sandbox_user ? *run_as_ : Credentials{});
}

common::Result<CloneOutcome> LocalRuntime::clone_repository(const CloneRequest &request) {
  CloneOutcome outcome;
  outcome.handle = RuntimeHandle{
      .id = request.sandbox_id, .root = sandbox_dir(request.sandbox_id), .container = "", .image = ""};
  const auto &root = outcome.handle.root;

  std::error_code ec;
  if (fs::exists(root, ec)) {
    return common::Result<CloneOutcome>::failure("sandbox directory already exists: " +
                                                 root.string());
  }
  fs::create_directories(root, ec);
  if (ec) {
    return common::Result<CloneOutcome>::failure("cannot create " + root.string() + ": " +
                                                 ec.message());
  }

  auto abort = [&](const std::string &message) {
    (void)destroy(outcome.handle);
    return common::Result<CloneOutcome>::failure(message);
  };

  const auto cloned = run_script(root, clone_script(request), request.clone_timeout, request.cancel);
  if (!cloned.ok()) {
    return abort("clone failed: " + cloned.error());
  }
  if (cloned.value().exit_code != 0) {
    return abort("clone failed: " + common::trim(cloned.value().stderr_text));
  }

  for (const auto &command : request.setup_commands) {
    const auto setup = run_script(root, command, request.setup_timeout, request.cancel);
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

  const auto pruned =
      run_script(root, prune_history_script(request.base_commit), request.clone_timeout, request.cancel);
  if (!pruned.ok() || pruned.value().exit_code != 0) {
    return abort("checkout of base commit failed: " +
                 (pruned.ok() ? common::trim(pruned.value().stderr_text) : pruned.error()));
  }
  if (auto owned = hand_over(root, true); !owned.ok()) {
    return abort(owned.error());
  }
  return common::Result<CloneOutcome>::success(std::move(outcome));
}

common::Status LocalRuntime::set_read_only(const RuntimeHandle &handle, const bool read_only) {
  if (read_only) {
    if (auto owned = hand_over(handle.root, false); !owned.ok()) {
      return owned;
    }
    return set_tree_read_only(handle.root, true);
  }
  if (auto writable = set_tree_read_only(handle.root, false); !writable.ok()) {
    return writable;
  }
  return hand_over(handle.root, true);
}

common::Result<ExecResult> LocalRuntime::execute(const RuntimeHandle &handle,
                                                 const ExecRequest &request) {
  return run_bash(handle, request, false);
}

common::Result<ExecResult> LocalRuntime::run_bash(const RuntimeHandle &handle,
                                                  const ExecRequest &request,
                                                  const bool privileged) {
  if (!privileged && !run_as_error_.empty()) {
    return common::Result<ExecResult>::failure(run_as_error_);
  }
  const fs::path workdir = request.workdir.empty() ? handle.root : request.workdir;
  std::error_code ec;
  if (!fs::is_directory(handle.root, ec)) {
    return common::Result<ExecResult>::failure("sandbox root is gone: " + handle.root.string());
  }

  ProcessOptions options{.allow_failure = true,
                         .timeout = request.timeout,
                         .cwd = workdir,
                         .env = request.env,
                         .stdin_data = request.stdin_data,
                         .cancel = request.cancel,
                         .run_as = std::nullopt};
  if (!privileged && run_as_.has_value()) {
    options.run_as = run_as_;
    // Read-only trees belong to root; git must still open them.
    options.env.emplace_back("GIT_CONFIG_COUNT", "1");
    options.env.emplace_back("GIT_CONFIG_KEY_0", "safe.directory");
    options.env.emplace_back("GIT_CONFIG_VALUE_0", "*");
  }
  auto ran = runner_->run({"/bin/bash", "-c", request.command}, options);
  if (!ran.ok()) {
    return common::Result<ExecResult>::failure(ran.error());
  }
  auto &process = ran.value();

  ExecResult result;
  result.exit_code = process.exit_code;
  result.timed_out = process.timed_out;
  result.duration = process.duration;
  result.stdout_text = std::move(process.stdout_text);
  result.stderr_text = std::move(process.stderr_text);
  return common::Result<ExecResult>::success(std::move(result));
}

common::Result<RuntimeHandle> LocalRuntime::snapshot(const RuntimeHandle &source,
                                                     const std::string &sandbox_id) {
  RuntimeHandle handle{
      .id = sandbox_id, .root = sandbox_dir(sandbox_id), .container = "", .image = ""};
  auto copied = copy_tree_writable(source.root, handle.root);
  if (copied.ok()) {
    copied = hand_over(handle.root, true);
  }
  if (!copied.ok()) {
    (void)destroy(handle);
    return common::Result<RuntimeHandle>::failure(copied.error());
  }
  return common::Result<RuntimeHandle>::success(std::move(handle));
}

common::Status LocalRuntime::destroy(const RuntimeHandle &handle) {
  const auto root = common::resolve_lexically(root_dir_, handle.root);
  if (root == root_dir_ || !common::is_subpath(root, root_dir_)) {
    return common::Status::error("refusing to remove " + root.string() + " outside " +
                                 root_dir_.string());
  }

  std::error_code ec;
  if (!fs::exists(fs::symlink_status(root, ec))) {
    return common::Status::success();
  }
  if (auto writable = set_tree_read_only(root, false); !writable.ok()) {
    return writable;
  }
  fs::remove_all(root, ec);
  if (ec) {
    return common::Status::error("cannot remove " + root.string() + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace sweguard::sandbox
