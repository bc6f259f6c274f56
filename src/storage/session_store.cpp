#include "synmem/storage/session_store.hpp"

#include <cmath>

namespace synmem::storage {

namespace {

constexpr double JULIAN_EPSILON_SECS = 1e-3;

constexpr const char *SESSION_COLUMNS =
    "session_id, project_path, branch, started_at, ended_at, status, summary, "
    "git_commit_start, git_commit_end, agent_type, agent_version";

model::Session session_from_row(const Statement &stmt) {
  model::Session session;
  session.session_id = stmt.column_text(0);
  session.project_path = stmt.column_text(1);
  session.branch = stmt.column_text(2);
  session.started_at = stmt.column_text(3);
  session.ended_at = stmt.column_optional_text(4);
  session.status =
      model::session_status_from_string(stmt.column_text(5)).value_or(model::SessionStatus::Active);
  session.summary = stmt.column_optional_text(6);
  session.git_commit_start = stmt.column_optional_text(7);
  session.git_commit_end = stmt.column_optional_text(8);
  session.agent_type =
      model::agent_type_from_string(stmt.column_text(9)).value_or(model::AgentType::Unknown);
  session.agent_version = stmt.column_optional_text(10);
  return session;
}

common::Result<std::vector<model::Session>> collect_sessions(Statement &stmt) {
  std::vector<model::Session> sessions;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    sessions.push_back(session_from_row(stmt));
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<model::Session>>::failure(stmt.error());
  }
  return common::Result<std::vector<model::Session>>::success(std::move(sessions));
}

common::Result<std::optional<model::Session>> single_session(Statement &stmt) {
  const int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return common::Result<std::optional<model::Session>>::success(session_from_row(stmt));
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::optional<model::Session>>::failure(stmt.error());
  }
  return common::Result<std::optional<model::Session>>::success(std::nullopt);
}

common::Result<std::int64_t> single_count(Statement &stmt) {
  if (stmt.step() != SQLITE_ROW) {
    return common::Result<std::int64_t>::failure(stmt.error());
  }
  return common::Result<std::int64_t>::success(stmt.column_int64(0));
}

} // namespace

common::Status SessionStore::create(const model::Session &session) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, R"(
INSERT INTO sessions (session_id, project_path, branch, started_at, status,
                      git_commit_start, agent_type, agent_version)
VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
)");
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, session.session_id);
  stmt.bind(2, session.project_path);
  stmt.bind(3, session.branch);
  stmt.bind(4, session.started_at);
  stmt.bind(5, std::string(model::to_string(session.status)));
  stmt.bind(6, session.git_commit_start);
  stmt.bind(7, std::string(model::to_string(session.agent_type)));
  stmt.bind(8, session.agent_version);
  return stmt.run();
}

common::Result<std::optional<model::Session>>
SessionStore::end(const std::string &session_id, const std::string &ended_at,
                  const std::optional<std::string> &summary,
                  const std::optional<std::string> &commit_end) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, R"(
UPDATE sessions
SET ended_at = ?1, status = 'completed', summary = ?2, git_commit_end = ?3
WHERE session_id = ?4 AND status = 'active'
)");
  if (!stmt.ok()) {
    return common::Result<std::optional<model::Session>>::failure(stmt.error());
  }
  stmt.bind(1, ended_at);
  stmt.bind(2, summary);
  stmt.bind(3, commit_end);
  stmt.bind(4, session_id);
  const auto status = stmt.run();
  if (!status.ok()) {
    return common::Result<std::optional<model::Session>>::failure(status);
  }
  if (sqlite3_changes(db_->handle()) == 0) {
    return common::Result<std::optional<model::Session>>::success(std::nullopt);
  }
  return get(session_id);
}

common::Result<std::size_t> SessionStore::abandon_active(const std::string &project_path,
                                                         const std::string &ended_at) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, R"(
UPDATE sessions SET ended_at = ?1, status = 'abandoned'
WHERE project_path = ?2 AND status = 'active'
)");
  if (!stmt.ok()) {
    return common::Result<std::size_t>::failure(stmt.error());
  }
  stmt.bind(1, ended_at);
  stmt.bind(2, project_path);
  const auto status = stmt.run();
  if (!status.ok()) {
    return common::Result<std::size_t>::failure(status);
  }
  return common::Result<std::size_t>::success(
      static_cast<std::size_t>(sqlite3_changes(db_->handle())));
}

common::Result<std::optional<model::Session>> SessionStore::get(const std::string &session_id) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  const std::string sql =
      std::string("SELECT ") + SESSION_COLUMNS + " FROM sessions WHERE session_id = ?1";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return common::Result<std::optional<model::Session>>::failure(stmt.error());
  }
  stmt.bind(1, session_id);
  return single_session(stmt);
}

common::Result<std::optional<model::Session>>
SessionStore::get_active(const std::string &project_path) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  const std::string sql = std::string("SELECT ") + SESSION_COLUMNS +
                          " FROM sessions WHERE project_path = ?1 AND status = 'active'"
                          " ORDER BY started_at DESC, rowid DESC LIMIT 1";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return common::Result<std::optional<model::Session>>::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  return single_session(stmt);
}

common::Result<std::vector<model::Session>>
SessionStore::recent(const std::string &project_path, const std::size_t limit,
                     const std::optional<std::string> &branch) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  std::string sql = std::string("SELECT ") + SESSION_COLUMNS +
                    " FROM sessions WHERE project_path = ?1 AND status = 'completed'";
  if (branch.has_value()) {
    sql += " AND branch = ?3";
  }
  sql += " ORDER BY started_at DESC, rowid DESC LIMIT ?2";

  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return common::Result<std::vector<model::Session>>::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  stmt.bind(2, static_cast<std::int64_t>(limit));
  if (branch.has_value()) {
    stmt.bind(3, *branch);
  }
  return collect_sessions(stmt);
}

common::Result<std::vector<model::Session>>
SessionStore::search(const std::string &project_path, const std::optional<std::string> &query,
                     const std::optional<std::string> &branch, const std::size_t limit) {
  if (!query.has_value() || query->empty()) {
    return recent(project_path, limit, branch);
  }

  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  std::string sql = std::string("SELECT ") + SESSION_COLUMNS +
                    " FROM sessions WHERE project_path = ?1 AND summary LIKE ?2";
  if (branch.has_value()) {
    sql += " AND branch = ?4";
  }
  sql += " ORDER BY started_at DESC, rowid DESC LIMIT ?3";

  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return common::Result<std::vector<model::Session>>::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  stmt.bind(2, "%" + *query + "%");
  stmt.bind(3, static_cast<std::int64_t>(limit));
  if (branch.has_value()) {
    stmt.bind(4, *branch);
  }
  return collect_sessions(stmt);
}

common::Result<std::optional<model::SessionMetrics>>
SessionStore::compute_metrics(const std::string &session_id, const common::TimePoint now) {
  using MetricsResult = common::Result<std::optional<model::SessionMetrics>>;
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());

  const auto session = get(session_id);
  if (!session.ok()) {
    return MetricsResult::failure(session.status());
  }
  if (!session.value().has_value()) {
    return MetricsResult::success(std::nullopt);
  }

  model::SessionMetrics metrics;
  metrics.session_id = session_id;
  const auto &row = *session.value();
  const std::string end_time = row.ended_at.value_or(common::format_iso(now));
  metrics.duration_secs = common::seconds_between(row.started_at, end_time);

  {
    Statement stmt(*db_, "SELECT category, COUNT(*) FROM session_events WHERE session_id = ?1 "
                         "GROUP BY category");
    if (!stmt.ok()) {
      return MetricsResult::failure(stmt.error());
    }
    stmt.bind(1, session_id);
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
      const std::int64_t count = stmt.column_int64(1);
      metrics.events_total += count;
      if (const auto category = model::event_category_from_string(stmt.column_text(0));
          category.has_value()) {
        metrics.events_by_category[static_cast<std::size_t>(*category)] = count;
      }
    }
    if (rc != SQLITE_DONE) {
      return MetricsResult::failure(stmt.error());
    }
  }

  {
    Statement stmt(*db_, "SELECT event_type, COUNT(*) FROM session_events WHERE session_id = ?1 "
                         "GROUP BY event_type");
    if (!stmt.ok()) {
      return MetricsResult::failure(stmt.error());
    }
    stmt.bind(1, session_id);
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
      const auto type = model::event_type_from_string(stmt.column_text(0));
      const std::int64_t count = stmt.column_int64(1);
      if (type == model::EventType::Decision) {
        metrics.decisions_recorded = count;
      } else if (type == model::EventType::Pattern) {
        metrics.patterns_discovered = count;
      } else if (type == model::EventType::ErrorResolved) {
        metrics.errors_resolved = count;
      }
    }
    if (rc != SQLITE_DONE) {
      return MetricsResult::failure(stmt.error());
    }
  }

  {
    Statement stmt(*db_, "SELECT COUNT(DISTINCT json_extract(detail_json, '$.path')) "
                         "FROM session_events WHERE session_id = ?1 AND event_type = 'file_read'");
    if (!stmt.ok()) {
      return MetricsResult::failure(stmt.error());
    }
    stmt.bind(1, session_id);
    const auto count = single_count(stmt);
    if (!count.ok()) {
      return MetricsResult::failure(count.status());
    }
    metrics.files_read = count.value();
  }

  {
    Statement stmt(*db_, "SELECT COUNT(DISTINCT json_extract(detail_json, '$.path')) "
                         "FROM session_events WHERE session_id = ?1 "
                         "AND event_type IN ('file_write', 'file_edit')");
    if (!stmt.ok()) {
      return MetricsResult::failure(stmt.error());
    }
    stmt.bind(1, session_id);
    const auto count = single_count(stmt);
    if (!count.ok()) {
      return MetricsResult::failure(count.status());
    }
    metrics.files_modified = count.value();
  }

  return MetricsResult::success(std::move(metrics));
}

common::Result<SessionStats> SessionStore::stats(const std::string &project_path,
                                                 const std::optional<std::string> &since) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  const std::string since_clause = since.has_value() ? " AND s.started_at >= ?2" : "";
  const auto bind_scope = [&](Statement &stmt) {
    stmt.bind(1, project_path);
    if (since.has_value()) {
      stmt.bind(2, *since);
    }
  };

  SessionStats stats;
  {
    const std::string sql = R"(
SELECT COUNT(*),
       COALESCE(SUM(CASE WHEN ended_at IS NOT NULL
                         THEN (julianday(ended_at) - julianday(started_at)) * 86400
                         ELSE 0 END), 0)
FROM sessions s WHERE s.project_path = ?1)" + since_clause;
    Statement stmt(*db_, sql.c_str());
    if (!stmt.ok()) {
      return common::Result<SessionStats>::failure(stmt.error());
    }
    bind_scope(stmt);
    if (stmt.step() != SQLITE_ROW) {
      return common::Result<SessionStats>::failure(stmt.error());
    }
    stats.total_sessions = stmt.column_int64(0);
    // julianday() differences drift by microseconds; whole seconds must not round down.
    stats.total_duration_secs =
        static_cast<std::int64_t>(std::floor(stmt.column_double(1) + JULIAN_EPSILON_SECS));
  }

  {
    const std::string sql = R"(
SELECT json_extract(e.detail_json, '$.path') AS path, COUNT(*) AS touches
FROM session_events e JOIN sessions s ON e.session_id = s.session_id
WHERE s.project_path = ?1)" + since_clause + R"(
  AND e.event_type IN ('file_read', 'file_write', 'file_edit')
  AND json_extract(e.detail_json, '$.path') IS NOT NULL
GROUP BY path ORDER BY touches DESC, path ASC LIMIT 10)";
    Statement stmt(*db_, sql.c_str());
    if (!stmt.ok()) {
      return common::Result<SessionStats>::failure(stmt.error());
    }
    bind_scope(stmt);
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
      stats.top_files.push_back({.path = stmt.column_text(0), .count = stmt.column_int64(1)});
    }
    if (rc != SQLITE_DONE) {
      return common::Result<SessionStats>::failure(stmt.error());
    }
  }

  {
    const std::string sql = R"(
SELECT e.category, COUNT(*) AS total
FROM session_events e JOIN sessions s ON e.session_id = s.session_id
WHERE s.project_path = ?1)" + since_clause + R"(
GROUP BY e.category ORDER BY total DESC, e.category ASC)";
    Statement stmt(*db_, sql.c_str());
    if (!stmt.ok()) {
      return common::Result<SessionStats>::failure(stmt.error());
    }
    bind_scope(stmt);
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
      stats.category_breakdown.push_back(
          {.category = stmt.column_text(0), .count = stmt.column_int64(1)});
    }
    if (rc != SQLITE_DONE) {
      return common::Result<SessionStats>::failure(stmt.error());
    }
  }

  {
    const std::string sql = R"(
SELECT COUNT(*) FROM session_events e JOIN sessions s ON e.session_id = s.session_id
WHERE s.project_path = ?1)" + since_clause + " AND e.event_type = 'pattern'";
    Statement stmt(*db_, sql.c_str());
    if (!stmt.ok()) {
      return common::Result<SessionStats>::failure(stmt.error());
    }
    bind_scope(stmt);
    const auto count = single_count(stmt);
    if (!count.ok()) {
      return common::Result<SessionStats>::failure(count.status());
    }
    stats.patterns_discovered = count.value();
  }

  return common::Result<SessionStats>::success(std::move(stats));
}

} // namespace synmem::storage
