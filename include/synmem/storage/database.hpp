#pragma once

#include "synmem/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace synmem::storage {

/// Owns one SQLite connection. Store objects hold a non-owning pointer to it.
class Database {
  struct ConnectionTag {};

public:
  /// Takes ownership of `db`. Only `open` can name the tag.
  Database(ConnectionTag, std::filesystem::path path, sqlite3 *db);
  ~Database();
  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  /// Opens (or creates) the file and applies connection pragmas. `:memory:` is accepted.
  [[nodiscard]] static common::Result<std::unique_ptr<Database>>
  open(const std::filesystem::path &path);

  [[nodiscard]] sqlite3 *handle() const { return db_; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::recursive_mutex &mutex() { return mutex_; }
  [[nodiscard]] std::string last_error() const;
  [[nodiscard]] bool in_transaction() const;

  [[nodiscard]] common::Status exec(const std::string &sql);

private:
  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  std::recursive_mutex mutex_;
};

/// Prepared statement that finalizes itself.
class Statement {
public:
  Statement(Database &db, const char *sql);
  ~Statement();
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string &error() const { return error_; }

  void bind(int index, const std::string &value);
  void bind(int index, const std::optional<std::string> &value);
  void bind(int index, std::int64_t value);
  void bind(int index, double value);
  void bind_null(int index);

  /// SQLITE_ROW, SQLITE_DONE, or an error code.
  int step();
  [[nodiscard]] common::Status run();

  [[nodiscard]] std::string column_text(int index) const;
  [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
  [[nodiscard]] std::int64_t column_int64(int index) const;
  [[nodiscard]] double column_double(int index) const;
  [[nodiscard]] bool column_is_null(int index) const;

private:
  sqlite3 *db_ = nullptr;
  sqlite3_stmt *stmt_ = nullptr;
  std::string error_;
};

/// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
/// Inside an already open transaction it joins the outer one and does nothing itself.
class Transaction {
public:
  explicit Transaction(Database &db);
  ~Transaction();
  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  [[nodiscard]] const common::Status &status() const { return status_; }
  [[nodiscard]] common::Status commit();

private:
  Database &db_;
  std::unique_lock<std::recursive_mutex> lock_;
  common::Status status_ = common::Status::success();
  bool owns_ = false;
  bool finished_ = false;
};

} // namespace synmem::storage
