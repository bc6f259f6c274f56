#include "synmem/storage/usage_store.hpp"

#include "synmem/storage/knowledge_store.hpp"

namespace synmem::storage {

namespace {

using UsageList = common::Result<std::vector<model::KnowledgeUsage>>;

UsageList collect_usage(Statement &stmt) {
  std::vector<model::KnowledgeUsage> rows;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    model::KnowledgeUsage usage;
    usage.usage_id = stmt.column_text(0);
    usage.knowledge_id = stmt.column_text(1);
    usage.session_id = stmt.column_text(2);
    usage.usage_type =
        model::usage_type_from_string(stmt.column_text(3)).value_or(model::UsageType::Surfaced);
    usage.timestamp = stmt.column_text(4);
    rows.push_back(std::move(usage));
  }
  if (rc != SQLITE_DONE) {
    return UsageList::failure(stmt.error());
  }
  return UsageList::success(std::move(rows));
}

} // namespace

common::Status KnowledgeUsageStore::record(const model::KnowledgeUsage &usage) {
  Transaction tx(*db_);
  if (!tx.status().ok()) {
    return tx.status();
  }

  {
    Statement stmt(*db_, "INSERT INTO knowledge_usage (usage_id, knowledge_id, session_id, "
                         "usage_type, timestamp) VALUES (?1, ?2, ?3, ?4, ?5)");
    if (!stmt.ok()) {
      return common::Status::error(stmt.error());
    }
    stmt.bind(1, usage.usage_id);
    stmt.bind(2, usage.knowledge_id);
    stmt.bind(3, usage.session_id);
    stmt.bind(4, std::string(model::to_string(usage.usage_type)));
    stmt.bind(5, usage.timestamp);
    const auto status = stmt.run();
    if (!status.ok()) {
      return status;
    }
  }

  KnowledgeStore knowledge(*db_);
  if (const auto status = knowledge.increment_usage(usage.knowledge_id); !status.ok()) {
    return status;
  }
  return tx.commit();
}

UsageList KnowledgeUsageStore::history(const std::string &knowledge_id, const std::size_t limit) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, "SELECT usage_id, knowledge_id, session_id, usage_type, timestamp "
                       "FROM knowledge_usage WHERE knowledge_id = ?1 "
                       "ORDER BY timestamp DESC, rowid DESC LIMIT ?2");
  if (!stmt.ok()) {
    return UsageList::failure(stmt.error());
  }
  stmt.bind(1, knowledge_id);
  stmt.bind(2, static_cast<std::int64_t>(limit));
  return collect_usage(stmt);
}

UsageList KnowledgeUsageStore::for_session(const std::string &session_id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, "SELECT usage_id, knowledge_id, session_id, usage_type, timestamp "
                       "FROM knowledge_usage WHERE session_id = ?1 "
                       "ORDER BY timestamp ASC, rowid ASC");
  if (!stmt.ok()) {
    return UsageList::failure(stmt.error());
  }
  stmt.bind(1, session_id);
  return collect_usage(stmt);
}

common::Result<UsageCounts>
KnowledgeUsageStore::counts_by_type(const std::string &project_path,
                                    const std::optional<std::string> &since) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  std::string sql = "SELECT ku.usage_type, COUNT(*) FROM knowledge_usage ku "
                    "JOIN promoted_knowledge pk ON ku.knowledge_id = pk.knowledge_id "
                    "WHERE pk.project_path = ?1";
  if (since.has_value()) {
    sql += " AND ku.timestamp >= ?2";
  }
  sql += " GROUP BY ku.usage_type";

  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return common::Result<UsageCounts>::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  if (since.has_value()) {
    stmt.bind(2, *since);
  }

  UsageCounts counts;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    const auto type = model::usage_type_from_string(stmt.column_text(0));
    if (!type.has_value()) {
      continue;
    }
    const std::int64_t n = stmt.column_int64(1);
    switch (*type) {
    case model::UsageType::Surfaced:
      counts.surfaced += n;
      break;
    case model::UsageType::Recalled:
      counts.recalled += n;
      break;
    case model::UsageType::Applied:
      counts.applied += n;
      break;
    }
  }
  if (rc != SQLITE_DONE) {
    return common::Result<UsageCounts>::failure(stmt.error());
  }
  return common::Result<UsageCounts>::success(counts);
}

} // namespace synmem::storage
