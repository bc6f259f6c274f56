#include "synmem/storage/knowledge_store.hpp"

#include "synmem/common/json_util.hpp"

namespace synmem::storage {

namespace {

using KnowledgeList = common::Result<std::vector<model::PromotedKnowledge>>;
using MaybeKnowledge = common::Result<std::optional<model::PromotedKnowledge>>;

constexpr const char *KNOWLEDGE_SELECT =
    "SELECT knowledge_id, project_path, session_id, source_event_id, title, content, "
    "knowledge_type, tags, created_at, synced_at, synapse_knowledge_id, branch, content_hash, "
    "usage_count, superseded_by FROM promoted_knowledge ";

model::PromotedKnowledge knowledge_from_row(const Statement &stmt) {
  model::PromotedKnowledge knowledge;
  knowledge.knowledge_id = stmt.column_text(0);
  knowledge.project_path = stmt.column_text(1);
  knowledge.session_id = stmt.column_optional_text(2);
  knowledge.source_event_id = stmt.column_optional_text(3);
  knowledge.title = stmt.column_text(4);
  knowledge.content = stmt.column_text(5);
  knowledge.knowledge_type = model::knowledge_type_from_string(stmt.column_text(6))
                                 .value_or(model::KnowledgeType::Decision);
  // Tags written by other tools may not be a string array; such rows read as untagged.
  auto tags = common::parse_json_string_array(stmt.column_text(7));
  if (tags.ok()) {
    knowledge.tags = std::move(tags.value());
  }
  knowledge.created_at = stmt.column_text(8);
  knowledge.synced_at = stmt.column_optional_text(9);
  knowledge.remote_knowledge_id = stmt.column_optional_text(10);
  knowledge.branch = stmt.column_optional_text(11);
  knowledge.content_hash = stmt.column_optional_text(12);
  knowledge.usage_count = stmt.column_int64(13);
  knowledge.superseded_by = stmt.column_optional_text(14);
  return knowledge;
}

KnowledgeList collect_knowledge(Statement &stmt) {
  std::vector<model::PromotedKnowledge> items;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    items.push_back(knowledge_from_row(stmt));
  }
  if (rc != SQLITE_DONE) {
    return KnowledgeList::failure(stmt.error());
  }
  return KnowledgeList::success(std::move(items));
}

MaybeKnowledge first_knowledge(Statement &stmt) {
  const int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return MaybeKnowledge::success(knowledge_from_row(stmt));
  }
  if (rc != SQLITE_DONE) {
    return MaybeKnowledge::failure(stmt.error());
  }
  return MaybeKnowledge::success(std::nullopt);
}

} // namespace

common::Status KnowledgeStore::insert(const model::PromotedKnowledge &knowledge) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, R"(
INSERT INTO promoted_knowledge
  (knowledge_id, project_path, session_id, source_event_id, title, content, knowledge_type,
   tags, created_at, branch, content_hash, usage_count)
VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)
)");
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, knowledge.knowledge_id);
  stmt.bind(2, knowledge.project_path);
  stmt.bind(3, knowledge.session_id);
  stmt.bind(4, knowledge.source_event_id);
  stmt.bind(5, knowledge.title);
  stmt.bind(6, knowledge.content);
  stmt.bind(7, std::string(model::to_string(knowledge.knowledge_type)));
  stmt.bind(8, common::json_string_array(knowledge.tags));
  stmt.bind(9, knowledge.created_at);
  stmt.bind(10, knowledge.branch);
  stmt.bind(11, knowledge.content_hash);
  stmt.bind(12, knowledge.usage_count);
  return stmt.run();
}

MaybeKnowledge KnowledgeStore::get(const std::string &knowledge_id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  const std::string sql = std::string(KNOWLEDGE_SELECT) + "WHERE knowledge_id = ?1";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return MaybeKnowledge::failure(stmt.error());
  }
  stmt.bind(1, knowledge_id);
  return first_knowledge(stmt);
}

KnowledgeList KnowledgeStore::for_project(const std::string &project_path,
                                          const std::optional<model::KnowledgeType> &type,
                                          const std::size_t limit) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  std::string sql =
      std::string(KNOWLEDGE_SELECT) + "WHERE project_path = ?1 AND superseded_by IS NULL";
  if (type.has_value()) {
    sql += " AND knowledge_type = ?3";
  }
  sql += " ORDER BY created_at DESC, rowid DESC LIMIT ?2";

  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return KnowledgeList::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  stmt.bind(2, static_cast<std::int64_t>(limit));
  if (type.has_value()) {
    stmt.bind(3, std::string(model::to_string(*type)));
  }
  return collect_knowledge(stmt);
}

KnowledgeList KnowledgeStore::all_active(const std::string &project_path) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  const std::string sql = std::string(KNOWLEDGE_SELECT) +
                          "WHERE project_path = ?1 AND superseded_by IS NULL "
                          "ORDER BY created_at DESC, rowid DESC";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return KnowledgeList::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  return collect_knowledge(stmt);
}

MaybeKnowledge KnowledgeStore::find_by_hash(const std::string &project_path,
                                            const std::string &content_hash) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  const std::string sql = std::string(KNOWLEDGE_SELECT) +
                          "WHERE project_path = ?1 AND content_hash = ?2 "
                          "AND superseded_by IS NULL ORDER BY created_at ASC, rowid ASC LIMIT 1";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return MaybeKnowledge::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  stmt.bind(2, content_hash);
  return first_knowledge(stmt);
}

KnowledgeList KnowledgeStore::unsynced(const std::string &project_path) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  const std::string sql = std::string(KNOWLEDGE_SELECT) +
                          "WHERE project_path = ?1 AND synced_at IS NULL "
                          "AND superseded_by IS NULL ORDER BY created_at ASC, rowid ASC";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return KnowledgeList::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  return collect_knowledge(stmt);
}

common::Status KnowledgeStore::mark_synced(const std::string &knowledge_id,
                                           const std::string &synced_at,
                                           const std::string &remote_id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, "UPDATE promoted_knowledge SET synced_at = ?1, synapse_knowledge_id = ?2 "
                       "WHERE knowledge_id = ?3");
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, synced_at);
  stmt.bind(2, remote_id);
  stmt.bind(3, knowledge_id);
  return stmt.run();
}

common::Status KnowledgeStore::mark_superseded(const std::string &old_id,
                                               const std::string &new_id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_,
                 "UPDATE promoted_knowledge SET superseded_by = ?1 WHERE knowledge_id = ?2");
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, new_id);
  stmt.bind(2, old_id);
  return stmt.run();
}

common::Status KnowledgeStore::increment_usage(const std::string &knowledge_id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, "UPDATE promoted_knowledge SET usage_count = usage_count + 1 "
                       "WHERE knowledge_id = ?1");
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, knowledge_id);
  return stmt.run();
}

common::Result<KnowledgeCount> KnowledgeStore::count(const std::string &project_path) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, "SELECT knowledge_type, COUNT(*) FROM promoted_knowledge "
                       "WHERE project_path = ?1 AND superseded_by IS NULL "
                       "GROUP BY knowledge_type");
  if (!stmt.ok()) {
    return common::Result<KnowledgeCount>::failure(stmt.error());
  }
  stmt.bind(1, project_path);

  KnowledgeCount counts;
  for (const auto type : {model::KnowledgeType::Decision, model::KnowledgeType::Pattern,
                          model::KnowledgeType::ErrorResolved, model::KnowledgeType::Milestone}) {
    counts.by_type[type] = 0;
  }

  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    const std::int64_t n = stmt.column_int64(1);
    counts.total += n;
    if (const auto type = model::knowledge_type_from_string(stmt.column_text(0));
        type.has_value()) {
      counts.by_type[*type] = n;
    }
  }
  if (rc != SQLITE_DONE) {
    return common::Result<KnowledgeCount>::failure(stmt.error());
  }
  return common::Result<KnowledgeCount>::success(std::move(counts));
}

} // namespace synmem::storage
