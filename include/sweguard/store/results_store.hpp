#pragma once

#include "sweguard/common/result.hpp"
#include "sweguard/harness/task_controller.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sweguard::store {

/// Per-task and per-attempt results of a run, kept in SQLite so interrupted runs can resume
/// and finished runs can be summarized offline.
class ResultsStore {
public:
  /// Creates the database and its schema when missing. `:memory:` opens a private database.
  [[nodiscard]] static common::Result<std::unique_ptr<ResultsStore>>
  open(const std::filesystem::path &path);

  ~ResultsStore();
  ResultsStore(const ResultsStore &) = delete;
  ResultsStore &operator=(const ResultsStore &) = delete;

  /// Replaces any earlier rows for the task in one transaction.
  [[nodiscard]] common::Status record(const harness::TaskOutcome &outcome);
  [[nodiscard]] common::Result<std::set<std::string>> completed_instances();
  /// Outcomes with per-attempt counters; transcripts are not loaded.
  [[nodiscard]] common::Result<std::vector<harness::TaskOutcome>> load_outcomes();

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  ResultsStore(std::filesystem::path path, sqlite3 *db);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status write_outcome(const harness::TaskOutcome &outcome);

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace sweguard::store
