#include "synmem/storage/file_importance_store.hpp"

#include <cmath>

namespace synmem::storage {

namespace {

constexpr double EDIT_WEIGHT = 3.0;
constexpr double HALF_LIFE_DAYS = 7.0;
constexpr double RESCORE_EPSILON = 0.01;

using FileList = common::Result<std::vector<model::FileImportance>>;

FileList collect_files(Statement &stmt) {
  std::vector<model::FileImportance> files;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    model::FileImportance file;
    file.project_path = stmt.column_text(0);
    file.file_path = stmt.column_text(1);
    file.read_count = stmt.column_int64(2);
    file.edit_count = stmt.column_int64(3);
    file.last_accessed_at = stmt.column_text(4);
    file.importance_score = stmt.column_double(5);
    files.push_back(std::move(file));
  }
  if (rc != SQLITE_DONE) {
    return FileList::failure(stmt.error());
  }
  return FileList::success(std::move(files));
}

} // namespace

double compute_importance_score(const std::int64_t read_count, const std::int64_t edit_count,
                                const std::string &last_accessed_at, const common::TimePoint now) {
  const double days = common::days_between(last_accessed_at, now).value_or(0.0);
  const double recency = std::pow(0.5, days / HALF_LIFE_DAYS);
  const double base = static_cast<double>(read_count) + static_cast<double>(edit_count) * EDIT_WEIGHT;
  return base * recency;
}

common::Result<model::FileImportance>
FileImportanceStore::record_access(const std::string &project_path, const std::string &file_path,
                                   const model::AccessType access, const common::TimePoint now) {
  Transaction tx(*db_);
  if (!tx.status().ok()) {
    return common::Result<model::FileImportance>::failure(tx.status());
  }

  model::FileImportance file;
  file.project_path = project_path;
  file.file_path = file_path;
  file.last_accessed_at = common::format_iso(now);

  {
    Statement stmt(*db_, "SELECT read_count, edit_count FROM file_importance "
                         "WHERE project_path = ?1 AND file_path = ?2");
    if (!stmt.ok()) {
      return common::Result<model::FileImportance>::failure(stmt.error());
    }
    stmt.bind(1, project_path);
    stmt.bind(2, file_path);
    const int rc = stmt.step();
    if (rc == SQLITE_ROW) {
      file.read_count = stmt.column_int64(0);
      file.edit_count = stmt.column_int64(1);
    } else if (rc != SQLITE_DONE) {
      return common::Result<model::FileImportance>::failure(stmt.error());
    }
  }

  if (access == model::AccessType::Read) {
    ++file.read_count;
  } else {
    ++file.edit_count;
  }
  file.importance_score =
      compute_importance_score(file.read_count, file.edit_count, file.last_accessed_at, now);

  {
    Statement stmt(*db_, R"(
INSERT INTO file_importance
  (project_path, file_path, read_count, edit_count, last_accessed_at, importance_score)
VALUES (?1, ?2, ?3, ?4, ?5, ?6)
ON CONFLICT(project_path, file_path) DO UPDATE SET
  read_count = excluded.read_count,
  edit_count = excluded.edit_count,
  last_accessed_at = excluded.last_accessed_at,
  importance_score = excluded.importance_score
)");
    if (!stmt.ok()) {
      return common::Result<model::FileImportance>::failure(stmt.error());
    }
    stmt.bind(1, project_path);
    stmt.bind(2, file_path);
    stmt.bind(3, file.read_count);
    stmt.bind(4, file.edit_count);
    stmt.bind(5, file.last_accessed_at);
    stmt.bind(6, file.importance_score);
    const auto status = stmt.run();
    if (!status.ok()) {
      return common::Result<model::FileImportance>::failure(status);
    }
  }

  const auto committed = tx.commit();
  if (!committed.ok()) {
    return common::Result<model::FileImportance>::failure(committed);
  }
  return common::Result<model::FileImportance>::success(std::move(file));
}

FileList FileImportanceStore::top(const std::string &project_path, const std::size_t limit) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, "SELECT project_path, file_path, read_count, edit_count, "
                       "last_accessed_at, importance_score FROM file_importance "
                       "WHERE project_path = ?1 ORDER BY importance_score DESC, file_path ASC "
                       "LIMIT ?2");
  if (!stmt.ok()) {
    return FileList::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  stmt.bind(2, static_cast<std::int64_t>(limit));
  return collect_files(stmt);
}

common::Result<std::size_t> FileImportanceStore::refresh(const std::string &project_path,
                                                         const common::TimePoint now) {
  Transaction tx(*db_);
  if (!tx.status().ok()) {
    return common::Result<std::size_t>::failure(tx.status());
  }

  std::vector<model::FileImportance> files;
  {
    Statement stmt(*db_, "SELECT project_path, file_path, read_count, edit_count, "
                         "last_accessed_at, importance_score FROM file_importance "
                         "WHERE project_path = ?1");
    if (!stmt.ok()) {
      return common::Result<std::size_t>::failure(stmt.error());
    }
    stmt.bind(1, project_path);
    auto loaded = collect_files(stmt);
    if (!loaded.ok()) {
      return common::Result<std::size_t>::failure(loaded.status());
    }
    files = std::move(loaded.value());
  }

  std::size_t updated = 0;
  for (const auto &file : files) {
    const double score =
        compute_importance_score(file.read_count, file.edit_count, file.last_accessed_at, now);
    if (std::fabs(score - file.importance_score) <= RESCORE_EPSILON) {
      continue;
    }

    Statement stmt(*db_, "UPDATE file_importance SET importance_score = ?1 "
                         "WHERE project_path = ?2 AND file_path = ?3");
    if (!stmt.ok()) {
      return common::Result<std::size_t>::failure(stmt.error());
    }
    stmt.bind(1, score);
    stmt.bind(2, project_path);
    stmt.bind(3, file.file_path);
    const auto status = stmt.run();
    if (!status.ok()) {
      return common::Result<std::size_t>::failure(status);
    }
    ++updated;
  }

  const auto committed = tx.commit();
  if (!committed.ok()) {
    return common::Result<std::size_t>::failure(committed);
  }
  return common::Result<std::size_t>::success(updated);
}

} // namespace synmem::storage
