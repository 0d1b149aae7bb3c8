#include "hotword/preference/store.hpp"

#include <chrono>
#include <cstdint>

namespace hotword::preference {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

std::int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

common::Result<std::optional<std::string>> MemoryPreferenceStore::get(const std::string &key) {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  return common::Result<std::optional<std::string>>::success(it->second);
}

common::Status MemoryPreferenceStore::set(const std::string &key, const std::string &value) {
  if (key.empty()) {
    return common::Status::error("preference key is empty");
  }
  values_[key] = value;
  return common::Status::success();
}

common::Status MemoryPreferenceStore::remove(const std::string &key) {
  values_.erase(key);
  return common::Status::success();
}

SqlitePreferenceStore::SqlitePreferenceStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_status_ = common::Status::error(db_ == nullptr ? "sqlite open failed"
                                                        : sqlite3_errmsg(db_));
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  open_status_ = init_schema();
}

SqlitePreferenceStore::~SqlitePreferenceStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqlitePreferenceStore::ready() const {
  if (db_ == nullptr) {
    return common::Status::error("preference db not initialized: " + open_status_.error());
  }
  return common::Status::success();
}

common::Status SqlitePreferenceStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("preference db not initialized");
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS preferences (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL,
  updated_at INTEGER NOT NULL
);
)");
}

common::Result<std::optional<std::string>> SqlitePreferenceStore::get(const std::string &key) {
  if (auto status = ready(); !status.ok()) {
    return common::Result<std::optional<std::string>>::from_status(status);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT value FROM preferences WHERE key = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<std::optional<std::string>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<std::string> value;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
    value = text == nullptr ? std::string() : std::string(text);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return common::Result<std::optional<std::string>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::optional<std::string>>::success(std::move(value));
}

common::Status SqlitePreferenceStore::set(const std::string &key, const std::string &value) {
  if (auto status = ready(); !status.ok()) {
    return status;
  }
  if (key.empty()) {
    return common::Status::error("preference key is empty");
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR REPLACE INTO preferences(key, value, updated_at) "
                    "VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, unix_now());

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status SqlitePreferenceStore::remove(const std::string &key) {
  if (auto status = ready(); !status.ok()) {
    return status;
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM preferences WHERE key = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

} // namespace hotword::preference
