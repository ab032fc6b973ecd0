#include "sweguard/task/dataset.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/common/json_util.hpp"
#include "sweguard/patch/diff.hpp"

namespace sweguard::task {

namespace {

std::string field(const common::JsonFlatMap &row, const std::string &key,
                  const std::string &fallback = "") {
  const auto it = row.find(key);
  if (it == row.end() || it->second == "null") {
    return fallback;
  }
  return it->second;
}

/// Test lists arrive either as arrays or as JSON-encoded strings holding arrays.
common::Result<std::vector<std::string>> test_list(const common::JsonFlatMap &row,
                                                   const std::string &upper,
                                                   const std::string &lower) {
  std::string raw = field(row, upper);
  if (raw.empty()) {
    raw = field(row, lower);
  }
  if (common::trim(raw).empty()) {
    return common::Result<std::vector<std::string>>::success({});
  }
  auto parsed = common::json_parse_string_array(raw);
  if (!parsed.ok()) {
    return common::Result<std::vector<std::string>>::failure(upper + ": " + parsed.error());
  }
  return parsed;
}

} // namespace

common::Result<Task> parse_task_json(const std::string &row_text) {
  auto parsed = common::json_parse_object(row_text);
  if (!parsed.ok()) {
    return common::Result<Task>::failure(parsed.error());
  }
  const auto &row = parsed.value();

  Task task;
  task.instance_id = field(row, "instance_id");
  task.repo = field(row, "repo");
  task.base_commit = field(row, "base_commit");
  if (task.instance_id.empty() || task.repo.empty() || task.base_commit.empty()) {
    return common::Result<Task>::failure("row requires instance_id, repo and base_commit");
  }
  task.environment_setup_commit = field(row, "environment_setup_commit", task.base_commit);
  task.problem_statement = field(row, "problem_statement");
  task.hints_text = field(row, "hints_text");
  task.version = field(row, "version");
  task.test_patch = field(row, "test_patch");
  task.created_at = field(row, "created_at");
  task.difficulty = field(row, "difficulty");
  task.runtime_version = resolve_runtime_version(task.repo, task.version);
  task.protected_paths = patch::touched_paths(task.test_patch);

  auto fail_to_pass = test_list(row, "FAIL_TO_PASS", "fail_to_pass");
  if (!fail_to_pass.ok()) {
    return common::Result<Task>::failure(fail_to_pass.error());
  }
  auto pass_to_pass = test_list(row, "PASS_TO_PASS", "pass_to_pass");
  if (!pass_to_pass.ok()) {
    return common::Result<Task>::failure(pass_to_pass.error());
  }
  task.fail_to_pass = std::move(fail_to_pass.value());
  task.pass_to_pass = std::move(pass_to_pass.value());
  if (task.fail_to_pass.empty()) {
    return common::Result<Task>::failure(task.instance_id + ": FAIL_TO_PASS is empty");
  }

  return common::Result<Task>::success(std::move(task));
}

common::Result<std::vector<Task>> parse_tasks_jsonl(const std::string &content) {
  std::vector<Task> tasks;
  std::size_t line_number = 0;
  for (const auto &line : common::split_lines(content)) {
    ++line_number;
    if (common::trim(line).empty()) {
      continue;
    }
    auto task = parse_task_json(line);
    if (!task.ok()) {
      return common::Result<std::vector<Task>>::failure(
          "line " + std::to_string(line_number) + ": " + task.error());
    }
    tasks.push_back(std::move(task.value()));
  }
  return common::Result<std::vector<Task>>::success(std::move(tasks));
}

common::Result<std::vector<Task>> load_tasks_jsonl(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<std::vector<Task>>::failure(content.error());
  }
  auto tasks = parse_tasks_jsonl(content.value());
  if (!tasks.ok()) {
    return common::Result<std::vector<Task>>::failure(path.string() + ": " + tasks.error());
  }
  return tasks;
}

std::vector<Task> filter_tasks(const std::vector<Task> &tasks, const TaskFilter &filter) {
  std::vector<Task> selected;
  for (const auto &task : tasks) {
    if (!filter.instance_id.empty() && task.instance_id != filter.instance_id) {
      continue;
    }
    if (!filter.repo.empty() && task.repo != filter.repo) {
      continue;
    }
    if (!filter.difficulty.empty() && task.difficulty != filter.difficulty) {
      continue;
    }
    selected.push_back(task);
    if (filter.max_tasks > 0 && selected.size() >= filter.max_tasks) {
      break;
    }
  }
  return selected;
}

} // namespace sweguard::task
