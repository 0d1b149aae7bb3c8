#pragma once

#include "hotword/common/result.hpp"

#include <filesystem>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <unordered_map>

namespace hotword::preference {

class IPreferenceStore {
public:
  virtual ~IPreferenceStore() = default;

  [[nodiscard]] virtual common::Result<std::optional<std::string>> get(const std::string &key) = 0;
  [[nodiscard]] virtual common::Status set(const std::string &key, const std::string &value) = 0;
  [[nodiscard]] virtual common::Status remove(const std::string &key) = 0;
};

class MemoryPreferenceStore final : public IPreferenceStore {
public:
  [[nodiscard]] common::Result<std::optional<std::string>> get(const std::string &key) override;
  [[nodiscard]] common::Status set(const std::string &key, const std::string &value) override;
  [[nodiscard]] common::Status remove(const std::string &key) override;

  [[nodiscard]] std::size_t size() const { return values_.size(); }

private:
  std::unordered_map<std::string, std::string> values_;
};

class SqlitePreferenceStore final : public IPreferenceStore {
public:
  explicit SqlitePreferenceStore(std::filesystem::path db_path);
  ~SqlitePreferenceStore() override;

  SqlitePreferenceStore(const SqlitePreferenceStore &) = delete;
  SqlitePreferenceStore &operator=(const SqlitePreferenceStore &) = delete;

  [[nodiscard]] common::Result<std::optional<std::string>> get(const std::string &key) override;
  [[nodiscard]] common::Status set(const std::string &key, const std::string &value) override;
  [[nodiscard]] common::Status remove(const std::string &key) override;

  // Error raised while opening the database or creating the schema, if any.
  [[nodiscard]] const common::Status &open_status() const { return open_status_; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status ready() const;

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  common::Status open_status_ = common::Status::success();
};

} // namespace hotword::preference
