#include "synmem/storage/value_metrics_store.hpp"

#include <cmath>

namespace synmem::storage {

common::Result<std::optional<model::ValueMetrics>>
ValueMetricsStore::get(const std::string &project_path) {
  using MaybeMetrics = common::Result<std::optional<model::ValueMetrics>>;
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, R"(
SELECT project_path, total_sessions, context_reuse_count, knowledge_surfaced_count,
       decisions_recalled_count, patterns_applied_count, errors_prevented_count,
       estimated_time_saved_secs, updated_at
FROM value_metrics WHERE project_path = ?1
)");
  if (!stmt.ok()) {
    return MaybeMetrics::failure(stmt.error());
  }
  stmt.bind(1, project_path);

  const int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return MaybeMetrics::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return MaybeMetrics::failure(stmt.error());
  }

  model::ValueMetrics metrics;
  metrics.project_path = stmt.column_text(0);
  metrics.total_sessions = stmt.column_int64(1);
  metrics.context_reuse_count = stmt.column_int64(2);
  metrics.knowledge_surfaced_count = stmt.column_int64(3);
  metrics.decisions_recalled_count = stmt.column_int64(4);
  metrics.patterns_applied_count = stmt.column_int64(5);
  metrics.errors_prevented_count = stmt.column_int64(6);
  metrics.estimated_time_saved_secs = stmt.column_int64(7);
  metrics.updated_at = stmt.column_text(8);
  return MaybeMetrics::success(std::move(metrics));
}

common::Result<model::ValueMetrics> ValueMetricsStore::ensure(const std::string &project_path,
                                                              const std::string &now) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  {
    Statement stmt(*db_, "INSERT OR IGNORE INTO value_metrics (project_path, updated_at) "
                         "VALUES (?1, ?2)");
    if (!stmt.ok()) {
      return common::Result<model::ValueMetrics>::failure(stmt.error());
    }
    stmt.bind(1, project_path);
    stmt.bind(2, now);
    const auto status = stmt.run();
    if (!status.ok()) {
      return common::Result<model::ValueMetrics>::failure(status);
    }
  }

  auto existing = get(project_path);
  if (!existing.ok()) {
    return common::Result<model::ValueMetrics>::failure(existing.status());
  }
  if (!existing.value().has_value()) {
    return common::Result<model::ValueMetrics>::failure("value metrics row missing for " +
                                                        project_path);
  }
  return common::Result<model::ValueMetrics>::success(std::move(*existing.value()));
}

common::Status ValueMetricsStore::bump(const std::string &project_path, const char *column,
                                       const std::int64_t count, const std::int64_t seconds_each,
                                       const std::string &now) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  const auto ensured = ensure(project_path, now);
  if (!ensured.ok()) {
    return ensured.status();
  }

  const std::string sql = std::string("UPDATE value_metrics SET ") + column + " = " + column +
                          " + ?1, estimated_time_saved_secs = estimated_time_saved_secs + ?2, "
                          "updated_at = ?3 WHERE project_path = ?4";
  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, count);
  stmt.bind(2, count * seconds_each);
  stmt.bind(3, now);
  stmt.bind(4, project_path);
  return stmt.run();
}

common::Status ValueMetricsStore::increment_sessions(const std::string &project_path,
                                                     const std::string &now) {
  return bump(project_path, "total_sessions", 1, 0, now);
}

common::Status ValueMetricsStore::increment_context_reuse(const std::string &project_path,
                                                          const std::string &now) {
  return bump(project_path, "context_reuse_count", 1, 0, now);
}

common::Status ValueMetricsStore::increment_knowledge_surfaced(const std::string &project_path,
                                                               const std::int64_t count,
                                                               const std::string &now) {
  return bump(project_path, "knowledge_surfaced_count", count, TimeSavings::KNOWLEDGE_SURFACE,
              now);
}

common::Status ValueMetricsStore::increment_decisions_recalled(const std::string &project_path,
                                                               const std::int64_t count,
                                                               const std::string &now) {
  return bump(project_path, "decisions_recalled_count", count, TimeSavings::DECISION_RECALL, now);
}

common::Status ValueMetricsStore::increment_patterns_applied(const std::string &project_path,
                                                             const std::int64_t count,
                                                             const std::string &now) {
  return bump(project_path, "patterns_applied_count", count, TimeSavings::PATTERN_APPLIED, now);
}

common::Status ValueMetricsStore::increment_errors_prevented(const std::string &project_path,
                                                             const std::int64_t count,
                                                             const std::string &now) {
  return bump(project_path, "errors_prevented_count", count, TimeSavings::ERROR_PREVENTED, now);
}

common::Result<ValueSummary> ValueMetricsStore::summary(const std::string &project_path,
                                                        const double hourly_rate) {
  const auto metrics = get(project_path);
  if (!metrics.ok()) {
    return common::Result<ValueSummary>::failure(metrics.status());
  }

  ValueSummary summary;
  if (!metrics.value().has_value()) {
    return common::Result<ValueSummary>::success(summary);
  }

  const auto &row = *metrics.value();
  summary.time_saved_minutes = row.estimated_time_saved_secs / 60;
  const double usd = static_cast<double>(row.estimated_time_saved_secs) / 3600.0 * hourly_rate;
  summary.estimated_value_usd = std::round(usd * 100.0) / 100.0;
  summary.knowledge_surfaced = row.knowledge_surfaced_count;
  summary.decisions_recalled = row.decisions_recalled_count;
  summary.patterns_applied = row.patterns_applied_count;
  summary.errors_prevented = row.errors_prevented_count;
  return common::Result<ValueSummary>::success(summary);
}

} // namespace synmem::storage
