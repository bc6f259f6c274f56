#pragma once

#include "synmem/common/result.hpp"
#include "synmem/model/types.hpp"
#include "synmem/storage/database.hpp"

#include <optional>
#include <string>
#include <vector>

namespace synmem::storage {

struct UsageCounts {
  std::int64_t surfaced = 0;
  std::int64_t recalled = 0;
  std::int64_t applied = 0;
};

class KnowledgeUsageStore {
public:
  explicit KnowledgeUsageStore(Database &db) : db_(&db) {}

  /// Logs the usage and bumps the item's usage counter in one transaction.
  [[nodiscard]] common::Status record(const model::KnowledgeUsage &usage);

  [[nodiscard]] common::Result<std::vector<model::KnowledgeUsage>>
  history(const std::string &knowledge_id, std::size_t limit = 50);
  [[nodiscard]] common::Result<std::vector<model::KnowledgeUsage>>
  for_session(const std::string &session_id);
  [[nodiscard]] common::Result<UsageCounts>
  counts_by_type(const std::string &project_path, const std::optional<std::string> &since);

private:
  Database *db_;
};

} // namespace synmem::storage
