#include "synmem/storage/database.hpp"

#include "synmem/common/fs.hpp"
#include "synmem/observability/global.hpp"

namespace synmem::storage {

Database::Database(ConnectionTag, std::filesystem::path path, sqlite3 *db)
    : path_(std::move(path)), db_(db) {}

Database::~Database() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Result<std::unique_ptr<Database>> Database::open(const std::filesystem::path &path) {
  const bool in_memory = path == ":memory:";
  if (!in_memory && !path.parent_path().empty()) {
    auto dir = common::ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return common::Result<std::unique_ptr<Database>>::failure(dir.error(), dir.code());
    }
  }

  sqlite3 *raw = nullptr;
  if (sqlite3_open(path.string().c_str(), &raw) != SQLITE_OK) {
    const std::string message = raw == nullptr ? "out of memory" : sqlite3_errmsg(raw);
    if (raw != nullptr) {
      sqlite3_close(raw);
    }
    return common::Result<std::unique_ptr<Database>>::failure("unable to open store " +
                                                              path.string() + ": " + message);
  }

  auto db = std::make_unique<Database>(ConnectionTag{}, path, raw);
  sqlite3_busy_timeout(raw, 5000);

  if (!in_memory) {
    auto status = db->exec("PRAGMA journal_mode=WAL;");
    if (!status.ok()) {
      return common::Result<std::unique_ptr<Database>>::failure(status);
    }
  }
  auto status = db->exec("PRAGMA foreign_keys=ON;");
  if (!status.ok()) {
    return common::Result<std::unique_ptr<Database>>::failure(status);
  }
  return common::Result<std::unique_ptr<Database>>::success(std::move(db));
}

std::string Database::last_error() const {
  return db_ == nullptr ? "database is not initialized" : sqlite3_errmsg(db_);
}

bool Database::in_transaction() const { return db_ != nullptr && sqlite3_get_autocommit(db_) == 0; }

common::Status Database::exec(const std::string &sql) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  char *err = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

Statement::Statement(Database &db, const char *sql) : db_(db.handle()) {
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    error_ = sqlite3_errmsg(db_);
    stmt_ = nullptr;
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

void Statement::bind(const int index, const std::string &value) {
  sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::bind(const int index, const std::optional<std::string> &value) {
  if (value.has_value()) {
    bind(index, *value);
  } else {
    bind_null(index);
  }
}

void Statement::bind(const int index, const std::int64_t value) {
  sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
}

void Statement::bind(const int index, const double value) {
  sqlite3_bind_double(stmt_, index, value);
}

void Statement::bind_null(const int index) { sqlite3_bind_null(stmt_, index); }

int Statement::step() {
  const int rc = sqlite3_step(stmt_);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    error_ = sqlite3_errmsg(db_);
  }
  return rc;
}

common::Status Statement::run() {
  if (step() != SQLITE_DONE) {
    return common::Status::error(error_);
  }
  return common::Status::success();
}

std::string Statement::column_text(const int index) const {
  const auto *text = sqlite3_column_text(stmt_, index);
  return text == nullptr ? std::string() : reinterpret_cast<const char *>(text);
}

std::optional<std::string> Statement::column_optional_text(const int index) const {
  if (column_is_null(index)) {
    return std::nullopt;
  }
  return column_text(index);
}

std::int64_t Statement::column_int64(const int index) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
}

double Statement::column_double(const int index) const {
  return sqlite3_column_double(stmt_, index);
}

bool Statement::column_is_null(const int index) const {
  return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

Transaction::Transaction(Database &db) : db_(db), lock_(db.mutex()) {
  if (db_.in_transaction()) {
    return;
  }
  status_ = db_.exec("BEGIN IMMEDIATE;");
  owns_ = status_.ok();
}

Transaction::~Transaction() {
  if (owns_ && !finished_) {
    const auto status = db_.exec("ROLLBACK;");
    if (!status.ok()) {
      observability::record_error("storage", "rollback failed: " + status.error());
    }
  }
}

common::Status Transaction::commit() {
  if (!status_.ok()) {
    return status_;
  }
  if (!owns_ || finished_) {
    return common::Status::success();
  }
  auto status = db_.exec("COMMIT;");
  if (status.ok()) {
    finished_ = true;
  }
  return status;
}

} // namespace synmem::storage
