#include "sweguard/sandbox/process.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <grp.h>
#include <mutex>
#include <poll.h>
#include <pwd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace sweguard::sandbox {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

/// Drains what is available. Closes `fd` once the writer side is gone so the poll loop
/// stops waking up for a hung-up pipe.
void read_into_buffer(int &fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (fd >= 0) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      return;
    }
    close_fd(fd);
  }
}

/// Parent environment with `overrides` applied, as owned "KEY=VALUE" strings.
std::vector<std::string>
build_environment(const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> out;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string item(*entry);
    const std::string key = item.substr(0, item.find('='));
    bool overridden = false;
    for (const auto &[name, value] : overrides) {
      if (name == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      out.push_back(item);
    }
  }
  for (const auto &[name, value] : overrides) {
    out.push_back(name + "=" + value);
  }
  return out;
}

int decode_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

common::Result<Credentials> resolve_credentials(const std::string &user) {
  if (user.empty()) {
    return common::Result<Credentials>::failure("no sandbox user configured");
  }
  uid_t numeric = 0;
  const auto [end, ec] = std::from_chars(user.data(), user.data() + user.size(), numeric);
  if (ec == std::errc() && end == user.data() + user.size()) {
    return common::Result<Credentials>::success(
        Credentials{.uid = numeric, .gid = static_cast<gid_t>(numeric)});
  }

  struct passwd entry {};
  struct passwd *found = nullptr;
  std::array<char, 4096> storage{};
  const int rc = getpwnam_r(user.c_str(), &entry, storage.data(), storage.size(), &found);
  if (rc != 0 || found == nullptr) {
    return common::Result<Credentials>::failure("unknown sandbox user: " + user);
  }
  return common::Result<Credentials>::success(
      Credentials{.uid = found->pw_uid, .gid = found->pw_gid});
}

PosixProcessRunner::PosixProcessRunner() {
  // Writes to a child that already exited must fail with EPIPE instead of killing us.
  static std::once_flag ignore_sigpipe;
  std::call_once(ignore_sigpipe, [] { (void)std::signal(SIGPIPE, SIG_IGN); });
}

common::Result<ProcessResult> PosixProcessRunner::run(const std::vector<std::string> &args,
                                                      const ProcessOptions &options) {
  if (args.empty()) {
    return common::Result<ProcessResult>::failure("command is empty");
  }

  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return common::Result<ProcessResult>::failure(std::string("failed to create pipes: ") +
                                                  std::strerror(errno));
  }

  const auto environment = build_environment(options.env);
  std::vector<char *> envp;
  envp.reserve(environment.size() + 1);
  for (const auto &entry : environment) {
    envp.push_back(const_cast<char *>(entry.c_str()));
  }
  envp.push_back(nullptr);

  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const std::string cwd = options.cwd.string();
  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return common::Result<ProcessResult>::failure("failed to fork " + args.front());
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)dup2(stdin_pipe[0], STDIN_FILENO);
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
      close(fds[0]);
      close(fds[1]);
    }
    if (options.run_as.has_value()) {
      if (setgroups(0, nullptr) != 0 || setgid(options.run_as->gid) != 0 ||
          setuid(options.run_as->uid) != 0) {
        const char message[] = "unable to drop privileges\n";
        (void)!write(STDERR_FILENO, message, sizeof(message) - 1);
        _exit(126);
      }
    }
    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      const char message[] = "unable to enter working directory\n";
      (void)!write(STDERR_FILENO, message, sizeof(message) - 1);
      _exit(127);
    }
    execvpe(argv[0], argv.data(), envp.data());
    _exit(127);
  }

  (void)setpgid(pid, pid);
  close_fd(stdin_pipe[0]);
  close_fd(stdout_pipe[1]);
  close_fd(stderr_pipe[1]);
  set_non_blocking(stdin_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  std::size_t stdin_written = 0;
  if (options.stdin_data.empty()) {
    close_fd(stdin_pipe[1]);
  }

  ProcessResult result;
  int status = 0;
  while (true) {
    if (stdin_pipe[1] >= 0) {
      const ssize_t written = write(stdin_pipe[1], options.stdin_data.data() + stdin_written,
                                    options.stdin_data.size() - stdin_written);
      if (written > 0) {
        stdin_written += static_cast<std::size_t>(written);
      }
      if (stdin_written >= options.stdin_data.size() ||
          (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) {
        close_fd(stdin_pipe[1]);
      }
    }

    read_into_buffer(stdout_pipe[0], result.stdout_text);
    read_into_buffer(stderr_pipe[0], result.stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    const bool expired = elapsed > options.timeout;
    const bool cancelled = options.cancel.is_cancelled();
    if (expired || cancelled) {
      result.timed_out = expired;
      result.cancelled = cancelled && !expired;
      (void)kill(-pid, SIGKILL);
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  // Background jobs the command left behind share its group.
  (void)kill(-pid, SIGKILL);

  read_into_buffer(stdout_pipe[0], result.stdout_text);
  read_into_buffer(stderr_pipe[0], result.stderr_text);
  close_fd(stdin_pipe[1]);
  close_fd(stdout_pipe[0]);
  close_fd(stderr_pipe[0]);

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  result.exit_code = decode_status(status);

  if (result.timed_out || result.cancelled) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return common::Result<ProcessResult>::failure(
          std::string(result.timed_out ? "command timed out: " : "command cancelled: ") +
          join_args(args));
    }
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "command failed: " + join_args(args)
                                    : result.stderr_text;
    return common::Result<ProcessResult>::failure(message);
  }

  return common::Result<ProcessResult>::success(std::move(result));
}

} // namespace sweguard::sandbox
