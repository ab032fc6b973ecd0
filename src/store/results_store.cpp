#include "sweguard/store/results_store.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/common/hash.hpp"

namespace sweguard::store {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? "" : reinterpret_cast<const char *>(text);
}

/// Finalizes a prepared statement on every exit path.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      error_ = sqlite3_errmsg(db);
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] sqlite3_stmt *get() const { return stmt_; }

private:
  sqlite3_stmt *stmt_ = nullptr;
  std::string error_;
};

} // namespace

common::Result<std::unique_ptr<ResultsStore>>
ResultsStore::open(const std::filesystem::path &path) {
  const bool in_memory = path.string() == ":memory:";
  if (!in_memory && path.has_parent_path()) {
    auto created = common::ensure_dir(path.parent_path());
    if (!created.ok()) {
      return common::Result<std::unique_ptr<ResultsStore>>::failure(created.error());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
    const std::string message =
        db == nullptr ? "sqlite3_open failed" : std::string(sqlite3_errmsg(db));
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return common::Result<std::unique_ptr<ResultsStore>>::failure("cannot open " + path.string() +
                                                                  ": " + message);
  }
  sqlite3_busy_timeout(db, 5000);

  std::unique_ptr<ResultsStore> store(new ResultsStore(path, db));
  if (auto status = store->init_schema(); !status.ok()) {
    return common::Result<std::unique_ptr<ResultsStore>>::failure("results schema: " +
                                                                  status.error());
  }
  return common::Result<std::unique_ptr<ResultsStore>>::success(std::move(store));
}

ResultsStore::ResultsStore(std::filesystem::path path, sqlite3 *db)
    : path_(std::move(path)), db_(db) {}

ResultsStore::~ResultsStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status ResultsStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS tasks (
  instance_id TEXT PRIMARY KEY,
  repo TEXT NOT NULL DEFAULT '',
  verdict TEXT NOT NULL,
  resolved INTEGER NOT NULL,
  resolved_at_1 INTEGER NOT NULL,
  resolved_at_3 INTEGER NOT NULL,
  tokens INTEGER NOT NULL,
  turns INTEGER NOT NULL,
  recorded_at TEXT NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS attempts (
  instance_id TEXT NOT NULL,
  attempt_index INTEGER NOT NULL,
  outcome TEXT NOT NULL,
  turns INTEGER NOT NULL,
  tokens INTEGER NOT NULL,
  duration_ms INTEGER NOT NULL,
  patch_sha256 TEXT,
  patch_applied INTEGER NOT NULL DEFAULT 0,
  error TEXT NOT NULL DEFAULT '',
  transcript_json TEXT NOT NULL,
  PRIMARY KEY (instance_id, attempt_index)
);
)");
}

common::Status ResultsStore::record(const harness::TaskOutcome &outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = exec_sql(db_, "BEGIN IMMEDIATE;"); !status.ok()) {
    return status;
  }
  auto status = write_outcome(outcome);
  if (!status.ok()) {
    if (auto rolled_back = exec_sql(db_, "ROLLBACK;"); !rolled_back.ok()) {
      return common::Status::error(status.error() + " (rollback failed: " + rolled_back.error() +
                                   ")");
    }
    return status;
  }
  return exec_sql(db_, "COMMIT;");
}

common::Status ResultsStore::write_outcome(const harness::TaskOutcome &outcome) {
  {
    Statement erase(db_, "DELETE FROM attempts WHERE instance_id = ?1");
    if (!erase.ok()) {
      return common::Status::error(erase.error());
    }
    sqlite3_bind_text(erase.get(), 1, outcome.instance_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(erase.get()) != SQLITE_DONE) {
      return common::Status::error(sqlite3_errmsg(db_));
    }
  }

  {
    Statement insert(db_, R"(
INSERT OR REPLACE INTO tasks(instance_id, repo, verdict, resolved, resolved_at_1, resolved_at_3,
                             tokens, turns, recorded_at)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
)");
    if (!insert.ok()) {
      return common::Status::error(insert.error());
    }
    const std::string verdict(harness::task_verdict_name(outcome.verdict));
    const std::string recorded_at = common::now_rfc3339();
    sqlite3_bind_text(insert.get(), 1, outcome.instance_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert.get(), 2, outcome.repo.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert.get(), 3, verdict.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(insert.get(), 4, outcome.resolved ? 1 : 0);
    sqlite3_bind_int(insert.get(), 5, outcome.resolved_at_1 ? 1 : 0);
    sqlite3_bind_int(insert.get(), 6, outcome.resolved_at_3 ? 1 : 0);
    sqlite3_bind_int64(insert.get(), 7, static_cast<sqlite3_int64>(outcome.total_tokens()));
    sqlite3_bind_int64(insert.get(), 8, static_cast<sqlite3_int64>(outcome.total_turns()));
    sqlite3_bind_text(insert.get(), 9, recorded_at.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(insert.get()) != SQLITE_DONE) {
      return common::Status::error(sqlite3_errmsg(db_));
    }
  }

  for (const auto &attempt : outcome.attempts) {
    Statement insert(db_, R"(
INSERT INTO attempts(instance_id, attempt_index, outcome, turns, tokens, duration_ms,
                     patch_sha256, patch_applied, error, transcript_json)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
)");
    if (!insert.ok()) {
      return common::Status::error(insert.error());
    }
    const std::string outcome_name(harness::attempt_outcome_name(attempt.outcome));
    const std::string transcript = harness::encode_transcript_json(attempt.transcript);
    sqlite3_bind_text(insert.get(), 1, outcome.instance_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(insert.get(), 2, static_cast<int>(attempt.index));
    sqlite3_bind_text(insert.get(), 3, outcome_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert.get(), 4, static_cast<sqlite3_int64>(attempt.turns));
    sqlite3_bind_int64(insert.get(), 5, static_cast<sqlite3_int64>(attempt.tokens));
    sqlite3_bind_int64(insert.get(), 6, static_cast<sqlite3_int64>(attempt.duration.count()));
    if (attempt.submitted_patch.has_value()) {
      const std::string digest = common::sha256_hex(*attempt.submitted_patch);
      sqlite3_bind_text(insert.get(), 7, digest.c_str(), -1, SQLITE_TRANSIENT);
    } else {
      sqlite3_bind_null(insert.get(), 7);
    }
    sqlite3_bind_int(insert.get(), 8, attempt.patch_applied() ? 1 : 0);
    sqlite3_bind_text(insert.get(), 9, attempt.error.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert.get(), 10, transcript.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(insert.get()) != SQLITE_DONE) {
      return common::Status::error(sqlite3_errmsg(db_));
    }
  }
  return common::Status::success();
}

common::Result<std::set<std::string>> ResultsStore::completed_instances() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement select(db_, "SELECT instance_id FROM tasks");
  if (!select.ok()) {
    return common::Result<std::set<std::string>>::failure(select.error());
  }
  std::set<std::string> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
    out.insert(column_text(select.get(), 0));
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::set<std::string>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::set<std::string>>::success(std::move(out));
}

common::Result<std::vector<harness::TaskOutcome>> ResultsStore::load_outcomes() {
  using Outcomes = std::vector<harness::TaskOutcome>;
  std::lock_guard<std::mutex> lock(mutex_);

  Outcomes outcomes;
  {
    Statement select(db_, R"(
SELECT instance_id, repo, verdict, resolved, resolved_at_1, resolved_at_3
FROM tasks ORDER BY instance_id
)");
    if (!select.ok()) {
      return common::Result<Outcomes>::failure(select.error());
    }
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
      harness::TaskOutcome outcome;
      outcome.instance_id = column_text(select.get(), 0);
      outcome.repo = column_text(select.get(), 1);
      const auto verdict = harness::parse_task_verdict(column_text(select.get(), 2));
      if (!verdict.has_value()) {
        return common::Result<Outcomes>::failure("unknown verdict stored for " +
                                                 outcome.instance_id);
      }
      outcome.verdict = *verdict;
      outcome.resolved = sqlite3_column_int(select.get(), 3) != 0;
      outcome.resolved_at_1 = sqlite3_column_int(select.get(), 4) != 0;
      outcome.resolved_at_3 = sqlite3_column_int(select.get(), 5) != 0;
      outcomes.push_back(std::move(outcome));
    }
    if (rc != SQLITE_DONE) {
      return common::Result<Outcomes>::failure(sqlite3_errmsg(db_));
    }
  }

  Statement attempts(db_, R"(
SELECT attempt_index, outcome, turns, tokens, duration_ms, patch_sha256, patch_applied, error
FROM attempts WHERE instance_id = ?1 ORDER BY attempt_index
)");
  if (!attempts.ok()) {
    return common::Result<Outcomes>::failure(attempts.error());
  }
  for (auto &outcome : outcomes) {
    sqlite3_reset(attempts.get());
    sqlite3_bind_text(attempts.get(), 1, outcome.instance_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(attempts.get())) == SQLITE_ROW) {
      harness::Attempt attempt;
      attempt.index = static_cast<std::uint32_t>(sqlite3_column_int(attempts.get(), 0));
      const auto parsed = harness::parse_attempt_outcome(column_text(attempts.get(), 1));
      attempt.outcome = parsed.value_or(harness::AttemptOutcome::Errored);
      attempt.turns = static_cast<std::uint32_t>(sqlite3_column_int64(attempts.get(), 2));
      attempt.tokens = static_cast<std::uint64_t>(sqlite3_column_int64(attempts.get(), 3));
      attempt.duration = std::chrono::milliseconds(sqlite3_column_int64(attempts.get(), 4));
      if (sqlite3_column_type(attempts.get(), 5) != SQLITE_NULL) {
        validator::PatchResult patch;
        patch.applied = sqlite3_column_int(attempts.get(), 6) != 0;
        attempt.patch = std::move(patch);
      }
      attempt.error = column_text(attempts.get(), 7);
      outcome.attempts.push_back(std::move(attempt));
    }
    if (rc != SQLITE_DONE) {
      return common::Result<Outcomes>::failure(sqlite3_errmsg(db_));
    }
  }
  return common::Result<Outcomes>::success(std::move(outcomes));
}

} // namespace sweguard::store
