#include "sweguard/config/config.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/common/toml.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>

namespace sweguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".sweguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("SWEGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::uint32_t get_u32(const common::TomlDocument &doc, const std::string &key,
                      const std::uint32_t fallback) {
  const std::uint64_t value = doc.get_u64(key, fallback);
  return value > UINT32_MAX ? fallback : static_cast<std::uint32_t>(value);
}

bool env_u32(const char *name, std::uint32_t &out) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return false;
  }
  const std::string text = common::trim(raw);
  std::uint32_t parsed = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return false;
  }
  out = parsed;
  return true;
}

void load_run_config(RunConfig &run, const common::TomlDocument &doc) {
  run.dataset_path = expand_config_value(doc.get_string("run.dataset_path", run.dataset_path));
  run.instance_id = doc.get_string("run.instance_id", run.instance_id);
  run.repo = doc.get_string("run.repo", run.repo);
  run.max_tasks = get_u32(doc, "run.max_tasks", run.max_tasks);
  run.max_turns = get_u32(doc, "run.max_turns", run.max_turns);
  run.max_attempts = get_u32(doc, "run.max_attempts", run.max_attempts);
  run.bash_timeout_secs = get_u32(doc, "run.bash_timeout_secs", run.bash_timeout_secs);
  run.task_timeout_secs = get_u32(doc, "run.task_timeout_secs", run.task_timeout_secs);
  run.concurrency = get_u32(doc, "run.concurrency", run.concurrency);
  run.output_path = expand_config_value(doc.get_string("run.output_path", run.output_path));
  run.results_db = doc.get_string("run.results_db", run.results_db);
  run.resume = doc.get_bool("run.resume", run.resume);
}

void load_sandbox_config(SandboxConfig &sandbox, const common::TomlDocument &doc) {
  sandbox.runtime = common::to_lower(doc.get_string("sandbox.runtime", sandbox.runtime));
  sandbox.image = doc.get_string("sandbox.image", sandbox.image);
  sandbox.dockerfile = expand_config_value(doc.get_string("sandbox.dockerfile", sandbox.dockerfile));
  sandbox.repo_root = doc.get_string("sandbox.repo_root", sandbox.repo_root);
  sandbox.container_prefix = doc.get_string("sandbox.container_prefix", sandbox.container_prefix);
  sandbox.user = common::trim(doc.get_string("sandbox.user", sandbox.user));
  sandbox.memory_limit = doc.get_string("sandbox.memory_limit", sandbox.memory_limit);
  sandbox.cpu_limit = doc.get_double("sandbox.cpu_limit", sandbox.cpu_limit);
  sandbox.network_mode = doc.get_string("sandbox.network_mode", sandbox.network_mode);
  sandbox.isolate_network = doc.get_bool("sandbox.isolate_network", sandbox.isolate_network);
  sandbox.local_root = doc.get_string("sandbox.local_root", sandbox.local_root);
  sandbox.repo_url_template =
      doc.get_string("sandbox.repo_url_template", sandbox.repo_url_template);
  sandbox.setup_commands = doc.get_string_array("sandbox.setup_commands", sandbox.setup_commands);
  sandbox.clone_timeout_secs =
      get_u32(doc, "sandbox.clone_timeout_secs", sandbox.clone_timeout_secs);
  sandbox.setup_timeout_secs =
      get_u32(doc, "sandbox.setup_timeout_secs", sandbox.setup_timeout_secs);
  sandbox.max_stdout_bytes = doc.get_u64("sandbox.max_stdout_bytes", sandbox.max_stdout_bytes);
  sandbox.max_stderr_bytes = doc.get_u64("sandbox.max_stderr_bytes", sandbox.max_stderr_bytes);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *endpoint = std::getenv("SWEGUARD_AGENT_ENDPOINT");
      endpoint != nullptr && *endpoint) {
    config.agent.endpoint = endpoint;
  }
  if (const char *runtime = std::getenv("SWEGUARD_RUNTIME"); runtime != nullptr && *runtime) {
    config.sandbox.runtime = common::to_lower(runtime);
  }
  if (const char *dataset = std::getenv("SWEGUARD_DATASET"); dataset != nullptr && *dataset) {
    config.run.dataset_path = common::expand_path(dataset);
  }
  (void)env_u32("SWEGUARD_MAX_TURNS", config.run.max_turns);
  (void)env_u32("SWEGUARD_MAX_ATTEMPTS", config.run.max_attempts);
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  load_run_config(config.run, doc);
  load_sandbox_config(config.sandbox, doc);

  config.policy.deny_paths = doc.get_string_array("policy.deny_paths", config.policy.deny_paths);
  config.policy.device_paths =
      doc.get_string_array("policy.device_paths", config.policy.device_paths);

  config.validator.test_timeout_secs =
      get_u32(doc, "validator.test_timeout_secs", config.validator.test_timeout_secs);
  config.validator.apply_timeout_secs =
      get_u32(doc, "validator.apply_timeout_secs", config.validator.apply_timeout_secs);

  config.agent.endpoint = expand_config_value(doc.get_string("agent.endpoint", config.agent.endpoint));
  config.agent.request_timeout_secs =
      get_u32(doc, "agent.request_timeout_secs", config.agent.request_timeout_secs);
  config.agent.retries = get_u32(doc, "agent.retries", config.agent.retries);
  config.agent.backoff_ms = get_u32(doc, "agent.backoff_ms", config.agent.backoff_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto text = common::read_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(text.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  using Failure = common::Result<std::vector<std::string>>;

  if (config.run.max_turns == 0) {
    return Failure::failure("run.max_turns must be at least 1");
  }
  if (config.run.max_attempts == 0) {
    return Failure::failure("run.max_attempts must be at least 1");
  }
  if (config.run.bash_timeout_secs == 0 || config.run.task_timeout_secs == 0) {
    return Failure::failure("run.bash_timeout_secs and run.task_timeout_secs must be positive");
  }
  if (config.run.concurrency == 0) {
    return Failure::failure("run.concurrency must be at least 1");
  }
  if (config.validator.test_timeout_secs == 0 || config.validator.apply_timeout_secs == 0) {
    return Failure::failure("validator timeouts must be positive");
  }

  const std::string runtime = common::to_lower(config.sandbox.runtime);
  if (runtime != "docker" && runtime != "local") {
    return Failure::failure("Unsupported sandbox.runtime: " + config.sandbox.runtime);
  }
  if (config.sandbox.repo_url_template.find("{repo}") == std::string::npos) {
    return Failure::failure("sandbox.repo_url_template must contain {repo}");
  }
  if (runtime == "docker" && !common::starts_with(config.sandbox.repo_root, "/")) {
    return Failure::failure("sandbox.repo_root must be absolute: " + config.sandbox.repo_root);
  }
  if (config.sandbox.cpu_limit < 0.0) {
    return Failure::failure("sandbox.cpu_limit must not be negative");
  }
  if (config.sandbox.user.empty() || config.sandbox.user == "root" || config.sandbox.user == "0") {
    return Failure::failure("sandbox.user must name an unprivileged account");
  }

  if (config.agent.endpoint.find("://") == std::string::npos) {
    return Failure::failure("agent.endpoint must include a scheme: " + config.agent.endpoint);
  }

  for (const auto &path : config.policy.deny_paths) {
    if (!common::starts_with(path, "/") && !common::starts_with(path, "~")) {
      return Failure::failure("policy.deny_paths entries must be absolute: " + path);
    }
  }

  if (config.run.max_attempts > 3) {
    warnings.push_back("run.max_attempts > 3: pass@3 only considers the first three attempts");
  }
  if (config.run.bash_timeout_secs > config.run.task_timeout_secs) {
    warnings.push_back("run.bash_timeout_secs exceeds run.task_timeout_secs");
  }
  if (config.run.dataset_path.empty()) {
    warnings.push_back("run.dataset_path is not set");
  }

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none" && backend != "noop" && !backend.empty()) {
    warnings.push_back("unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace sweguard::config
