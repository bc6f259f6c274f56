#pragma once

#include "synmem/common/result.hpp"
#include "synmem/model/types.hpp"
#include "synmem/storage/database.hpp"

#include <optional>
#include <string>
#include <vector>

namespace synmem::storage {

struct AgentSessionCount {
  model::AgentType agent_type = model::AgentType::Unknown;
  std::int64_t session_count = 0;
};

/// Registry of agents that have opened sessions.
class AgentStore {
public:
  explicit AgentStore(Database &db) : db_(&db) {}

  /// First sighting inserts with one session; later ones bump last-seen and the total.
  [[nodiscard]] common::Result<model::AgentInfo> upsert(model::AgentType agent,
                                                        const std::string &now);
  [[nodiscard]] common::Result<std::optional<model::AgentInfo>> get(model::AgentType agent);
  [[nodiscard]] common::Result<std::vector<model::AgentInfo>> all();
  [[nodiscard]] common::Result<std::vector<AgentSessionCount>>
  stats(const std::string &project_path, const std::optional<std::string> &since);

private:
  Database *db_;
};

} // namespace synmem::storage
