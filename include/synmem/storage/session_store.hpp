#pragma once

#include "synmem/common/clock.hpp"
#include "synmem/common/result.hpp"
#include "synmem/model/types.hpp"
#include "synmem/storage/database.hpp"

#include <optional>
#include <string>
#include <vector>

namespace synmem::storage {

struct FileTouchCount {
  std::string path;
  std::int64_t count = 0;
};

struct CategoryCount {
  std::string category;
  std::int64_t count = 0;
};

struct SessionStats {
  std::int64_t total_sessions = 0;
  std::int64_t total_duration_secs = 0;
  std::vector<FileTouchCount> top_files;
  std::vector<CategoryCount> category_breakdown;
  std::int64_t patterns_discovered = 0;
};

class SessionStore {
public:
  explicit SessionStore(Database &db) : db_(&db) {}

  [[nodiscard]] common::Status create(const model::Session &session);

  /// Completes an active session. nullopt when the session is missing or not active.
  [[nodiscard]] common::Result<std::optional<model::Session>>
  end(const std::string &session_id, const std::string &ended_at,
      const std::optional<std::string> &summary, const std::optional<std::string> &commit_end);

  /// Marks every active session of the project abandoned; returns how many changed.
  [[nodiscard]] common::Result<std::size_t> abandon_active(const std::string &project_path,
                                                           const std::string &ended_at);

  [[nodiscard]] common::Result<std::optional<model::Session>> get(const std::string &session_id);
  [[nodiscard]] common::Result<std::optional<model::Session>>
  get_active(const std::string &project_path);

  /// Completed sessions, newest first.
  [[nodiscard]] common::Result<std::vector<model::Session>>
  recent(const std::string &project_path, std::size_t limit,
         const std::optional<std::string> &branch = std::nullopt);

  /// Sessions whose summary contains `query`; falls back to `recent` without one.
  [[nodiscard]] common::Result<std::vector<model::Session>>
  search(const std::string &project_path, const std::optional<std::string> &query,
         const std::optional<std::string> &branch, std::size_t limit);

  [[nodiscard]] common::Result<std::optional<model::SessionMetrics>>
  compute_metrics(const std::string &session_id, common::TimePoint now);

  [[nodiscard]] common::Result<SessionStats> stats(const std::string &project_path,
                                                   const std::optional<std::string> &since);

private:
  Database *db_;
};

} // namespace synmem::storage
