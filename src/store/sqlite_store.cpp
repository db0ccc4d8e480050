#include "distill/store/sqlite_store.hpp"

#include "distill/common/time.hpp"

#include <sqlite3.h>

namespace distill::store {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return storage_error(msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

} // namespace

SqliteRecordStore::SqliteRecordStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }

  if (!init_schema().ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteRecordStore::~SqliteRecordStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

std::string_view SqliteRecordStore::name() const { return "sqlite"; }

common::Status SqliteRecordStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS records (
  namespace TEXT NOT NULL,
  key TEXT NOT NULL,
  body TEXT NOT NULL,
  updated_at TEXT NOT NULL,
  PRIMARY KEY (namespace, key)
);
)");
}

common::Status SqliteRecordStore::put(const std::string &ns, const std::string &key,
                                      const std::string &json) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return storage_error("cannot open record store at " + db_path_.string());
  }
  if (key.empty()) {
    return storage_error("record key must not be empty");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO records(namespace, key, body, updated_at) VALUES(?1, ?2, ?3, ?4)
ON CONFLICT(namespace, key) DO UPDATE SET body = excluded.body, updated_at = excluded.updated_at
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_error(sqlite3_errmsg(db_));
  }

  const std::string now = common::now_rfc3339();
  sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, now.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::optional<std::string>> SqliteRecordStore::get(const std::string &ns,
                                                                  const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<std::string>>::failure(
        storage_error("cannot open record store at " + db_path_.string()));
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT body FROM records WHERE namespace = ?1 AND key = ?2";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::optional<std::string>>::failure(storage_error(sqlite3_errmsg(db_)));
  }
  sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<std::string> body;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    body = column_text(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return common::Result<std::optional<std::string>>::success(std::move(body));
}

common::Result<std::vector<StoredRecord>>
SqliteRecordStore::query(const std::string &ns, const std::vector<RecordFilter> &filters) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<StoredRecord>>::failure(
        storage_error("cannot open record store at " + db_path_.string()));
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT key, body FROM records WHERE namespace = ?1 ORDER BY key ASC";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<StoredRecord>>::failure(storage_error(sqlite3_errmsg(db_)));
  }
  sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<StoredRecord> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    StoredRecord record{.key = column_text(stmt, 0), .json = column_text(stmt, 1)};
    if (record_matches(record.json, filters)) {
      out.push_back(std::move(record));
    }
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<StoredRecord>>::failure(storage_error(sqlite3_errmsg(db_)));
  }
  return common::Result<std::vector<StoredRecord>>::success(std::move(out));
}

common::Result<bool> SqliteRecordStore::remove(const std::string &ns, const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure(
        storage_error("cannot open record store at " + db_path_.string()));
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM records WHERE namespace = ?1 AND key = ?2", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(storage_error(sqlite3_errmsg(db_)));
  }
  sqlite3_bind_text(stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(storage_error(sqlite3_errmsg(db_)));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

} // namespace distill::store
