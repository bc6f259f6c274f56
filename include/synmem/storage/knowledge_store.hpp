#pragma once

#include "synmem/common/result.hpp"
#include "synmem/model/types.hpp"
#include "synmem/storage/database.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace synmem::storage {

struct KnowledgeCount {
  std::int64_t total = 0;
  std::map<model::KnowledgeType, std::int64_t> by_type;
};

/// Promoted knowledge. Every query except `get` hides superseded items.
class KnowledgeStore {
public:
  explicit KnowledgeStore(Database &db) : db_(&db) {}

  [[nodiscard]] common::Status insert(const model::PromotedKnowledge &knowledge);
  [[nodiscard]] common::Result<std::optional<model::PromotedKnowledge>>
  get(const std::string &knowledge_id);

  /// Newest first.
  [[nodiscard]] common::Result<std::vector<model::PromotedKnowledge>>
  for_project(const std::string &project_path,
              const std::optional<model::KnowledgeType> &type = std::nullopt,
              std::size_t limit = 50);

  /// Every visible item of the project, newest first. Duplicate candidates come from here.
  [[nodiscard]] common::Result<std::vector<model::PromotedKnowledge>>
  all_active(const std::string &project_path);

  [[nodiscard]] common::Result<std::optional<model::PromotedKnowledge>>
  find_by_hash(const std::string &project_path, const std::string &content_hash);

  /// Not yet synced, oldest first.
  [[nodiscard]] common::Result<std::vector<model::PromotedKnowledge>>
  unsynced(const std::string &project_path);

  [[nodiscard]] common::Status mark_synced(const std::string &knowledge_id,
                                           const std::string &synced_at,
                                           const std::string &remote_id);
  [[nodiscard]] common::Status mark_superseded(const std::string &old_id,
                                               const std::string &new_id);
  [[nodiscard]] common::Status increment_usage(const std::string &knowledge_id);

  [[nodiscard]] common::Result<KnowledgeCount> count(const std::string &project_path);

private:
  Database *db_;
};

} // namespace synmem::storage
