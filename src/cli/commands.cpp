#include "sweguard/cli/commands.hpp"

#include "sweguard/agent/http_channel.hpp"
#include "sweguard/common/fs.hpp"
#include "sweguard/config/config.hpp"
#include "sweguard/harness/run.hpp"
#include "sweguard/metrics/aggregator.hpp"
#include "sweguard/metrics/scorecard.hpp"
#include "sweguard/observability/factory.hpp"
#include "sweguard/observability/global.hpp"
#include "sweguard/patch/diff.hpp"
#include "sweguard/sandbox/factory.hpp"
#include "sweguard/security/policy.hpp"
#include "sweguard/store/results_store.hpp"
#include "sweguard/task/dataset.hpp"

#include <charconv>
#include <csignal>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace sweguard::cli {

namespace {

constexpr int CANCELLED_EXIT_CODE = 130;

common::CancellationToken *g_run_cancel = nullptr;

void handle_stop_signal(int) {
  if (g_run_cancel != nullptr) {
    g_run_cancel->cancel();
  }
}

/// Routes SIGINT and SIGTERM to `token` for as long as it lives.
class SignalCancellation {
public:
  explicit SignalCancellation(common::CancellationToken &token) {
    g_run_cancel = &token;
    previous_int_ = std::signal(SIGINT, handle_stop_signal);
    previous_term_ = std::signal(SIGTERM, handle_stop_signal);
  }
  ~SignalCancellation() {
    std::signal(SIGINT, previous_int_);
    std::signal(SIGTERM, previous_term_);
    g_run_cancel = nullptr;
  }
  SignalCancellation(const SignalCancellation &) = delete;
  SignalCancellation &operator=(const SignalCancellation &) = delete;

private:
  void (*previous_int_)(int) = SIG_DFL;
  void (*previous_term_)(int) = SIG_DFL;
};

std::string version_string() {
#ifdef SWEGUARD_VERSION
  return std::string("sweguard ") + SWEGUARD_VERSION;
#else
  return "sweguard 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

bool parse_u32(const std::string &raw, std::uint32_t &out) {
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return !raw.empty() && ec == std::errc() && ptr == last;
}

/// Applies `run` flags on top of the loaded configuration.
bool apply_run_options(std::vector<std::string> &args, config::Config &config,
                       std::string &error) {
  std::string value;
  if (take_option(args, "--dataset", value)) {
    config.run.dataset_path = value;
  }
  if (take_option(args, "--instance-id", value)) {
    config.run.instance_id = value;
  }
  if (take_option(args, "--repo", value)) {
    config.run.repo = value;
  }
  if (take_option(args, "--runtime", value)) {
    config.sandbox.runtime = value;
  }
  if (take_option(args, "--endpoint", value)) {
    config.agent.endpoint = value;
  }
  if (take_option(args, "--output", value)) {
    config.run.output_path = value;
  }
  if (take_flag(args, "--resume")) {
    config.run.resume = true;
  }

  const std::vector<std::pair<std::string, std::uint32_t *>> counts = {
      {"--max-tasks", &config.run.max_tasks},
      {"--max-turns", &config.run.max_turns},
      {"--attempts", &config.run.max_attempts},
      {"--bash-timeout", &config.run.bash_timeout_secs},
      {"--task-timeout", &config.run.task_timeout_secs},
      {"--concurrency", &config.run.concurrency},
  };
  for (const auto &[flag, target] : counts) {
    if (take_option(args, flag, value) && !parse_u32(value, *target)) {
      error = "invalid value for " + flag + ": " + value;
      return false;
    }
  }

  if (!args.empty()) {
    error = "unexpected argument: " + args.front();
    return false;
  }
  return true;
}

void print_scorecard(const metrics::Scorecard &scorecard) {
  std::cout << metrics::format_scorecard_summary(scorecard);
}

metrics::Scorecard fold_outcomes(const std::vector<harness::TaskOutcome> &outcomes,
                                 const std::set<std::string> &selected) {
  metrics::Scorecard scorecard;
  for (const auto &outcome : outcomes) {
    if (selected.empty() || selected.contains(outcome.instance_id)) {
      metrics::fold_outcome(scorecard, outcome);
    }
  }
  scorecard.sort_rows();
  return scorecard;
}

int run_run(std::vector<std::string> args) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << "config error: " << loaded.error() << "\n";
    return 1;
  }
  config::Config config = std::move(loaded.value());

  std::string error;
  if (!apply_run_options(args, config, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  auto warnings = config::validate_config(config);
  if (!warnings.ok()) {
    std::cerr << "config error: " << warnings.error() << "\n";
    return 1;
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  if (config.run.dataset_path.empty()) {
    std::cerr << "no dataset: pass --dataset or set run.dataset_path\n";
    return 1;
  }

  observability::set_global_observer(observability::create_observer(config));

  auto loaded_tasks = task::load_tasks_jsonl(common::expand_path(config.run.dataset_path));
  if (!loaded_tasks.ok()) {
    std::cerr << "dataset error: " << loaded_tasks.error() << "\n";
    return 1;
  }
  auto tasks = task::filter_tasks(loaded_tasks.value(),
                                  task::TaskFilter{.instance_id = config.run.instance_id,
                                                   .repo = config.run.repo,
                                                   .difficulty = "",
                                                   .max_tasks = config.run.max_tasks});
  std::set<std::string> selected;
  for (const auto &task : tasks) {
    selected.insert(task.instance_id);
  }

  auto opened = store::ResultsStore::open(common::expand_path(config.run.results_db));
  if (!opened.ok()) {
    std::cerr << "results store error: " << opened.error() << "\n";
    return 1;
  }
  auto &store = *opened.value();

  if (config.run.resume) {
    auto completed = store.completed_instances();
    if (!completed.ok()) {
      std::cerr << "results store error: " << completed.error() << "\n";
      return 1;
    }
    std::erase_if(tasks, [&completed](const task::Task &task) {
      return completed.value().contains(task.instance_id);
    });
    std::cerr << "resuming: " << tasks.size() << " of " << selected.size()
              << " tasks left to run\n";
  }

  auto runtime = sandbox::create_runtime(config.sandbox);
  if (!runtime.ok()) {
    std::cerr << "sandbox error: " << runtime.error() << "\n";
    return 1;
  }
  auto manager = std::make_shared<sandbox::SandboxManager>(config.sandbox, runtime.value());
  auto channels = std::make_shared<agent::HttpAgentChannelFactory>(
      config.agent, std::make_shared<agent::CurlHttpClient>());

  common::CancellationToken cancel;
  SignalCancellation signals(cancel);

  metrics::MetricsAggregator aggregator;
  harness::RunCoordinator coordinator(config, manager, channels, aggregator, &store);
  std::cerr << "running " << tasks.size() << " tasks on the " << manager->runtime_name()
            << " runtime with " << config.run.concurrency << " workers\n";
  const auto stats = coordinator.run(tasks, cancel);
  metrics::Scorecard scorecard = aggregator.finish();

  if (config.run.resume) {
    auto outcomes = store.load_outcomes();
    if (!outcomes.ok()) {
      std::cerr << "results store error: " << outcomes.error() << "\n";
      return 1;
    }
    scorecard = fold_outcomes(outcomes.value(), selected);
  }

  const std::string output = common::expand_path(config.run.output_path);
  if (auto written = common::write_file_atomic(output, metrics::encode_scorecard_json(scorecard));
      !written.ok()) {
    std::cerr << "cannot write scorecard: " << written.error() << "\n";
    return 1;
  }
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }

  print_scorecard(scorecard);
  std::cout << "\nScorecard written to " << output << "\n";
  if (cancel.is_cancelled()) {
    std::cerr << "run cancelled: " << stats.skipped << " task(s) not started\n";
    return CANCELLED_EXIT_CODE;
  }
  return 0;
}

int run_summarize(std::vector<std::string> args) {
  std::string db_path;
  if (take_option(args, "--db", db_path)) {
    auto opened = store::ResultsStore::open(common::expand_path(db_path));
    if (!opened.ok()) {
      std::cerr << opened.error() << "\n";
      return 1;
    }
    auto outcomes = opened.value()->load_outcomes();
    if (!outcomes.ok()) {
      std::cerr << outcomes.error() << "\n";
      return 1;
    }
    print_scorecard(fold_outcomes(outcomes.value(), {}));
    return 0;
  }

  if (args.size() != 1) {
    std::cerr << "usage: sweguard summarize <scorecard.json | --db PATH>\n";
    return 1;
  }
  auto content = common::read_file(common::expand_path(args[0]));
  if (!content.ok()) {
    std::cerr << content.error() << "\n";
    return 1;
  }
  auto scorecard = metrics::decode_scorecard_json(content.value());
  if (!scorecard.ok()) {
    std::cerr << scorecard.error() << "\n";
    return 1;
  }
  print_scorecard(scorecard.value());
  return 0;
}

int run_policy_check(std::vector<std::string> args) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << "config error: " << loaded.error() << "\n";
    return 1;
  }
  const config::Config &config = loaded.value();

  std::string mode_name = "bash";
  std::string root = config.sandbox.repo_root;
  std::string cwd;
  std::string test_patch_file;
  std::string base_commit;
  (void)take_option(args, "--mode", mode_name);
  (void)take_option(args, "--root", root);
  (void)take_option(args, "--cwd", cwd);
  (void)take_option(args, "--test-patch", test_patch_file);
  (void)take_option(args, "--base-commit", base_commit);

  std::size_t command_start = 0;
  if (!args.empty() && args.front() == "--") {
    command_start = 1;
  } else if (!args.empty() && common::starts_with(args.front(), "--")) {
    std::cerr << "unknown option: " << args.front() << "\n";
    return 1;
  }
  const std::string command = join_tokens(args, command_start);
  if (common::trim(command).empty()) {
    std::cerr << "usage: sweguard policy-check [--mode bash|debug] [--root R] [--cwd C] "
                 "[--test-patch FILE] [--base-commit SHA] -- <command>\n";
    return 1;
  }

  security::ExecutionMode mode = security::ExecutionMode::Bash;
  if (mode_name == "debug") {
    mode = security::ExecutionMode::Debug;
  } else if (mode_name != "bash") {
    std::cerr << "unknown mode: " << mode_name << " (expected bash or debug)\n";
    return 1;
  }

  task::Task task;
  task.instance_id = "policy-check";
  task.base_commit = base_commit;
  if (!test_patch_file.empty()) {
    auto patch_text = common::read_file(common::expand_path(test_patch_file));
    if (!patch_text.ok()) {
      std::cerr << patch_text.error() << "\n";
      return 1;
    }
    task.test_patch = patch_text.value();
    task.protected_paths = patch::touched_paths(task.test_patch);
  }

  const std::filesystem::path repo_root(root);
  const security::PolicyScope scope{
      .mode = mode,
      .repo_root = repo_root,
      .working_dir = cwd.empty() ? repo_root : common::resolve_lexically(repo_root, cwd),
      .writable_root = mode == security::ExecutionMode::Debug ? repo_root
                                                              : std::filesystem::path{},
  };
  const security::SecurityPolicy policy(config.policy);
  const auto decision = policy.evaluate(command, scope, task);
  if (decision.allowed) {
    std::cout << "ALLOW (" << security::execution_mode_name(mode) << " mode)\n";
    return 0;
  }
  std::cout << "DENY " << security::policy_rule_name(decision.rule) << ": " << decision.reason
            << "\n";
  return POLICY_CHECK_DENIED_EXIT_CODE;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  sweguard" << RESET << DIM
            << "  sandboxed evaluation harness for bug-fixing agents" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "sweguard [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "run" << RESET << DIM
            << "            Evaluate the agent on a dataset and write a scorecard" << RESET
            << "\n";
  std::cout << DIM << "                 --dataset P --instance-id ID --repo R --max-tasks N\n"
            << "                 --max-turns N --attempts K --bash-timeout S --task-timeout S\n"
            << "                 --concurrency N --runtime docker|local --endpoint URL\n"
            << "                 --output P --resume" << RESET << "\n";
  std::cout << "  " << GREEN << "summarize" << RESET << DIM
            << "      Print a stored scorecard (file or --db PATH)" << RESET << "\n";
  std::cout << "  " << GREEN << "policy-check" << RESET << DIM
            << "   Dry-run the command policy: --mode --root --cwd --test-patch -- CMD"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM
            << "    Show the configuration file location" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_run(std::move(args));
  }
  if (subcommand == "summarize") {
    return run_summarize(std::move(args));
  }
  if (subcommand == "policy-check") {
    return run_policy_check(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace sweguard::cli
