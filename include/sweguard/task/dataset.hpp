#pragma once

#include "sweguard/common/result.hpp"
#include "sweguard/task/task.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sweguard::task {

struct TaskFilter {
  std::string instance_id;
  std::string repo;
  std::string difficulty;
  std::uint32_t max_tasks = 0;
};

/// Builds a task from one dataset row (a JSON object).
[[nodiscard]] common::Result<Task> parse_task_json(const std::string &row);

/// One row per line; blank lines are skipped.
[[nodiscard]] common::Result<std::vector<Task>> parse_tasks_jsonl(const std::string &content);
[[nodiscard]] common::Result<std::vector<Task>>
load_tasks_jsonl(const std::filesystem::path &path);

/// Applies instance_id, repo and difficulty, then caps at max_tasks (0 keeps all).
[[nodiscard]] std::vector<Task> filter_tasks(const std::vector<Task> &tasks,
                                             const TaskFilter &filter);

} // namespace sweguard::task
