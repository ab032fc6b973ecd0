#pragma once

#include "sweguard/agent/channel.hpp"
#include "sweguard/config/schema.hpp"
#include "sweguard/sandbox/process.hpp"
#include "sweguard/sandbox/runtime.hpp"
#include "sweguard/task/task.hpp"

#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sweguard::testing {

/// Local runtime, no setup commands, quiet observer and short timeouts.
config::Config test_config();

/// Two-test task whose test patch touches `tests/test_calc.py`.
task::Task sample_task();

/// Diff that edits `calc.py` only.
std::string sample_fix_diff();

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct FakeExecCall {
  std::string sandbox_id;
  std::string command;
  std::string stdin_data;
  std::filesystem::path workdir;
};

/// In-memory runtime. Commands are matched against scripted rules by substring, newest rule
/// first; unmatched commands exit 0 with no output. Every sandbox root is `/workspace/repo`.
class FakeRuntime final : public sandbox::ISandboxRuntime {
public:
  using Handler = std::function<sandbox::ExecResult(const FakeExecCall &call)>;

  void on_command(std::string needle, sandbox::ExecResult result);
  void on_command(std::string needle, Handler handler);
  void fail_clone(std::string error);
  void fail_snapshot(std::string error);

  [[nodiscard]] std::vector<FakeExecCall> calls() const;
  [[nodiscard]] std::size_t count_calls(const std::string &needle) const;
  [[nodiscard]] std::set<std::string> live_handles() const;
  [[nodiscard]] std::vector<std::string> destroyed() const;
  [[nodiscard]] std::size_t clone_count() const;
  [[nodiscard]] std::size_t snapshot_count() const;
  [[nodiscard]] bool is_read_only(const std::string &sandbox_id) const;

  [[nodiscard]] common::Result<sandbox::CloneOutcome>
  clone_repository(const sandbox::CloneRequest &request) override;
  [[nodiscard]] common::Status set_read_only(const sandbox::RuntimeHandle &handle,
                                             bool read_only) override;
  [[nodiscard]] common::Result<sandbox::ExecResult>
  execute(const sandbox::RuntimeHandle &handle, const sandbox::ExecRequest &request) override;
  [[nodiscard]] common::Result<sandbox::RuntimeHandle>
  snapshot(const sandbox::RuntimeHandle &source, const std::string &sandbox_id) override;
  [[nodiscard]] common::Status destroy(const sandbox::RuntimeHandle &handle) override;
  [[nodiscard]] std::string_view name() const override { return "fake"; }

private:
  struct Rule {
    std::string needle;
    Handler handler;
  };

  mutable std::mutex mutex_;
  std::vector<Rule> rules_;
  std::vector<FakeExecCall> calls_;
  std::set<std::string> live_;
  std::set<std::string> read_only_;
  std::vector<std::string> destroyed_;
  std::size_t clones_ = 0;
  std::size_t snapshots_ = 0;
  std::optional<std::string> clone_error_;
  std::optional<std::string> snapshot_error_;
};

/// The command a manager handed to the runtime, without the working-directory trailer.
std::string unwrap_command(const std::string &wrapped);

sandbox::ExecResult exec_result(int exit_code, std::string stdout_text = "",
                                std::string stderr_text = "");

agent::InboundMessage bash_reply(std::string command, std::optional<std::uint64_t> tokens = 10);
agent::InboundMessage debug_reply(std::string command, std::optional<std::uint64_t> tokens = 10);
agent::InboundMessage patch_reply(std::string diff, std::optional<std::uint64_t> tokens = 10);

/// Replays a fixed list of replies and records everything the harness sends.
class ScriptedChannel final : public agent::IAgentChannel {
public:
  explicit ScriptedChannel(std::vector<agent::InboundMessage> replies);

  [[nodiscard]] common::Result<agent::InboundMessage>
  begin(const agent::SessionStart &start, const common::Deadline &deadline,
        const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Result<agent::InboundMessage>
  exchange(const agent::TurnOutput &output, const common::Deadline &deadline,
           const common::CancellationToken &cancel) override;
  void end(const agent::AttemptReport &report) override;

  [[nodiscard]] const std::optional<agent::SessionStart> &start() const { return start_; }
  [[nodiscard]] const std::vector<agent::TurnOutput> &outputs() const { return outputs_; }
  [[nodiscard]] const std::optional<agent::AttemptReport> &report() const { return report_; }

private:
  [[nodiscard]] common::Result<agent::InboundMessage> next();

  std::deque<agent::InboundMessage> replies_;
  std::optional<agent::SessionStart> start_;
  std::vector<agent::TurnOutput> outputs_;
  std::optional<agent::AttemptReport> report_;
};

/// Hands every attempt a ScriptedChannel built by `script`.
class ScriptedChannelFactory final : public agent::IAgentChannelFactory {
public:
  using Script =
      std::function<std::vector<agent::InboundMessage>(const std::string &, std::uint32_t)>;

  explicit ScriptedChannelFactory(Script script);

  [[nodiscard]] std::unique_ptr<agent::IAgentChannel> create(const std::string &instance_id,
                                                             std::uint32_t attempt) override;
  [[nodiscard]] std::string_view name() const override { return "scripted"; }

  [[nodiscard]] std::vector<std::string> sessions() const;

private:
  Script script_;
  mutable std::mutex mutex_;
  std::vector<std::string> sessions_;
};

struct FakeProcessCall {
  std::vector<std::string> argv;
  sandbox::ProcessOptions options;
};

/// Records argv lists and answers from scripted rules matched against the joined command
/// line. Honors `allow_failure` the way the real runner does.
class FakeProcessRunner final : public sandbox::IProcessRunner {
public:
  void on_command(std::string needle, sandbox::ProcessResult result);

  [[nodiscard]] common::Result<sandbox::ProcessResult>
  run(const std::vector<std::string> &argv, const sandbox::ProcessOptions &options) override;

  [[nodiscard]] std::vector<FakeProcessCall> calls() const;
  [[nodiscard]] std::size_t count_calls(const std::string &needle) const;

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, sandbox::ProcessResult>> rules_;
  std::vector<FakeProcessCall> calls_;
};

/// Runs `git` with `args` in `cwd` and returns its trimmed stdout. Throws on failure.
std::string git(const std::filesystem::path &cwd, const std::vector<std::string> &args);

/// Initializes a repository at `path` with one committed file per entry of `files`.
/// Returns the commit id.
std::string init_git_repo(const std::filesystem::path &path,
                          const std::vector<std::pair<std::string, std::string>> &files);

} // namespace sweguard::testing
