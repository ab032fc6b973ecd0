#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sweguard::config {

struct RunConfig {
  std::string dataset_path;
  std::string instance_id;
  std::string repo;
  std::uint32_t max_tasks = 0;
  std::uint32_t max_turns = 10;
  std::uint32_t max_attempts = 1;
  std::uint32_t bash_timeout_secs = 30;
  std::uint32_t task_timeout_secs = 600;
  std::uint32_t concurrency = 1;
  std::string output_path = "scorecard.json";
  std::string results_db = "~/.sweguard/results.db";
  bool resume = false;
};

struct SandboxConfig {
  std::string runtime = "docker";
  std::string image = "sweguard-bash";
  std::string dockerfile;
  std::string repo_root = "/workspace/repo";
  std::string container_prefix = "sweguard-";
  // Unprivileged account agent commands run as: a user name or a numeric uid.
  std::string user = "sweguard";
  std::string memory_limit = "4g";
  double cpu_limit = 2.0;
  std::string network_mode = "bridge";
  bool isolate_network = true;
  std::string local_root = "~/.sweguard/sandboxes";
  std::string repo_url_template = "https://github.com/{repo}.git";
  std::vector<std::string> setup_commands = {
      "pip install -e . -q",
      "pip install -e '.[test]' -q",
      "pip install -r requirements.txt -q",
  };
  std::uint32_t clone_timeout_secs = 300;
  std::uint32_t setup_timeout_secs = 600;
  std::size_t max_stdout_bytes = 10'000;
  std::size_t max_stderr_bytes = 2'000;
};

struct PolicyConfig {
  std::vector<std::string> deny_paths;
  std::vector<std::string> device_paths = {"/dev/null", "/dev/stdout", "/dev/stderr",
                                           "/dev/stdin"};
};

struct ValidatorConfig {
  std::uint32_t test_timeout_secs = 120;
  std::uint32_t apply_timeout_secs = 60;
};

struct AgentConfig {
  std::string endpoint = "http://localhost:9010";
  std::uint32_t request_timeout_secs = 300;
  std::uint32_t retries = 2;
  std::uint32_t backoff_ms = 500;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  RunConfig run;
  SandboxConfig sandbox;
  PolicyConfig policy;
  ValidatorConfig validator;
  AgentConfig agent;
  ObservabilityConfig observability;
};

} // namespace sweguard::config
