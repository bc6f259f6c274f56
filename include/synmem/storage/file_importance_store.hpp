#pragma once

#include "synmem/common/clock.hpp"
#include "synmem/common/result.hpp"
#include "synmem/model/types.hpp"
#include "synmem/storage/database.hpp"

#include <string>
#include <vector>

namespace synmem::storage {

/// `(reads + 3 * edits) * 0.5^(days_since_access / 7)`.
[[nodiscard]] double compute_importance_score(std::int64_t read_count, std::int64_t edit_count,
                                              const std::string &last_accessed_at,
                                              common::TimePoint now);

class FileImportanceStore {
public:
  explicit FileImportanceStore(Database &db) : db_(&db) {}

  [[nodiscard]] common::Result<model::FileImportance>
  record_access(const std::string &project_path, const std::string &file_path,
                model::AccessType access, common::TimePoint now);

  /// Highest score first.
  [[nodiscard]] common::Result<std::vector<model::FileImportance>>
  top(const std::string &project_path, std::size_t limit = 10);

  /// Re-decays every score of the project; returns how many moved by more than 0.01.
  [[nodiscard]] common::Result<std::size_t> refresh(const std::string &project_path,
                                                    common::TimePoint now);

private:
  Database *db_;
};

} // namespace synmem::storage
