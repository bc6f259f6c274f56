#pragma once

#include "synmem/common/result.hpp"
#include "synmem/model/types.hpp"
#include "synmem/storage/database.hpp"

#include <optional>
#include <string>

namespace synmem::storage {

/// Estimated seconds saved per counted event.
struct TimeSavings {
  static constexpr std::int64_t KNOWLEDGE_SURFACE = 60;
  static constexpr std::int64_t DECISION_RECALL = 180;
  static constexpr std::int64_t PATTERN_APPLIED = 300;
  static constexpr std::int64_t ERROR_PREVENTED = 900;
};

struct ValueSummary {
  std::int64_t time_saved_minutes = 0;
  double estimated_value_usd = 0.0;
  std::int64_t knowledge_surfaced = 0;
  std::int64_t decisions_recalled = 0;
  std::int64_t patterns_applied = 0;
  std::int64_t errors_prevented = 0;
};

/// One counter row per project, created on first increment.
class ValueMetricsStore {
public:
  explicit ValueMetricsStore(Database &db) : db_(&db) {}

  [[nodiscard]] common::Result<model::ValueMetrics> ensure(const std::string &project_path,
                                                           const std::string &now);
  [[nodiscard]] common::Result<std::optional<model::ValueMetrics>>
  get(const std::string &project_path);

  [[nodiscard]] common::Status increment_sessions(const std::string &project_path,
                                                  const std::string &now);
  [[nodiscard]] common::Status increment_context_reuse(const std::string &project_path,
                                                       const std::string &now);
  [[nodiscard]] common::Status increment_knowledge_surfaced(const std::string &project_path,
                                                            std::int64_t count,
                                                            const std::string &now);
  [[nodiscard]] common::Status increment_decisions_recalled(const std::string &project_path,
                                                            std::int64_t count,
                                                            const std::string &now);
  [[nodiscard]] common::Status increment_patterns_applied(const std::string &project_path,
                                                          std::int64_t count,
                                                          const std::string &now);
  [[nodiscard]] common::Status increment_errors_prevented(const std::string &project_path,
                                                          std::int64_t count,
                                                          const std::string &now);

  [[nodiscard]] common::Result<ValueSummary> summary(const std::string &project_path,
                                                     double hourly_rate = 50.0);

private:
  [[nodiscard]] common::Status bump(const std::string &project_path, const char *column,
                                    std::int64_t count, std::int64_t seconds_each,
                                    const std::string &now);

  Database *db_;
};

} // namespace synmem::storage
