#include "synmem/storage/agent_store.hpp"

namespace synmem::storage {

namespace {

constexpr const char *AGENT_SELECT =
    "SELECT agent_type, display_name, first_seen_at, last_seen_at, total_sessions FROM agents ";

model::AgentInfo agent_from_row(const Statement &stmt) {
  model::AgentInfo info;
  info.agent_type =
      model::agent_type_from_string(stmt.column_text(0)).value_or(model::AgentType::Unknown);
  info.display_name = stmt.column_text(1);
  info.first_seen_at = stmt.column_text(2);
  info.last_seen_at = stmt.column_text(3);
  info.total_sessions = stmt.column_int64(4);
  return info;
}

} // namespace

common::Result<model::AgentInfo> AgentStore::upsert(const model::AgentType agent,
                                                    const std::string &now) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  {
    Statement stmt(*db_, R"(
INSERT INTO agents (agent_type, display_name, first_seen_at, last_seen_at, total_sessions)
VALUES (?1, ?2, ?3, ?3, 1)
ON CONFLICT(agent_type) DO UPDATE SET
  last_seen_at = excluded.last_seen_at,
  total_sessions = total_sessions + 1
)");
    if (!stmt.ok()) {
      return common::Result<model::AgentInfo>::failure(stmt.error());
    }
    stmt.bind(1, std::string(model::to_string(agent)));
    stmt.bind(2, std::string(model::agent_display_name(agent)));
    stmt.bind(3, now);
    const auto status = stmt.run();
    if (!status.ok()) {
      return common::Result<model::AgentInfo>::failure(status);
    }
  }

  const auto stored = get(agent);
  if (!stored.ok()) {
    return common::Result<model::AgentInfo>::failure(stored.status());
  }
  if (!stored.value().has_value()) {
    return common::Result<model::AgentInfo>::failure("agent row vanished after upsert");
  }
  return common::Result<model::AgentInfo>::success(*stored.value());
}

common::Result<std::optional<model::AgentInfo>> AgentStore::get(const model::AgentType agent) {
  using MaybeAgent = common::Result<std::optional<model::AgentInfo>>;
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  const std::string sql = std::string(AGENT_SELECT) + "WHERE agent_type = ?1";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return MaybeAgent::failure(stmt.error());
  }
  stmt.bind(1, std::string(model::to_string(agent)));
  const int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return MaybeAgent::success(agent_from_row(stmt));
  }
  if (rc != SQLITE_DONE) {
    return MaybeAgent::failure(stmt.error());
  }
  return MaybeAgent::success(std::nullopt);
}

common::Result<std::vector<model::AgentInfo>> AgentStore::all() {
  using AgentList = common::Result<std::vector<model::AgentInfo>>;
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  const std::string sql = std::string(AGENT_SELECT) + "ORDER BY total_sessions DESC, agent_type ASC";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return AgentList::failure(stmt.error());
  }
  std::vector<model::AgentInfo> agents;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    agents.push_back(agent_from_row(stmt));
  }
  if (rc != SQLITE_DONE) {
    return AgentList::failure(stmt.error());
  }
  return AgentList::success(std::move(agents));
}

common::Result<std::vector<AgentSessionCount>>
AgentStore::stats(const std::string &project_path, const std::optional<std::string> &since) {
  using CountList = common::Result<std::vector<AgentSessionCount>>;
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  std::string sql = "SELECT agent_type, COUNT(*) AS session_count FROM sessions "
                    "WHERE project_path = ?1";
  if (since.has_value()) {
    sql += " AND started_at >= ?2";
  }
  sql += " GROUP BY agent_type ORDER BY session_count DESC, agent_type ASC";

  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return CountList::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  if (since.has_value()) {
    stmt.bind(2, *since);
  }

  std::vector<AgentSessionCount> counts;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    counts.push_back(
        {.agent_type = model::agent_type_from_string(stmt.column_text(0))
                           .value_or(model::AgentType::Unknown),
         .session_count = stmt.column_int64(1)});
  }
  if (rc != SQLITE_DONE) {
    return CountList::failure(stmt.error());
  }
  return CountList::success(std::move(counts));
}

} // namespace synmem::storage
