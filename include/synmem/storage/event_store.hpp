#pragma once

#include "synmem/common/result.hpp"
#include "synmem/model/types.hpp"
#include "synmem/storage/database.hpp"

#include <optional>
#include <string>
#include <vector>

namespace synmem::storage {

class EventStore {
public:
  explicit EventStore(Database &db) : db_(&db) {}

  [[nodiscard]] common::Status insert(const model::SessionEvent &event);

  /// Events of one session in causal (timestamp ascending) order.
  [[nodiscard]] common::Result<std::vector<model::SessionEvent>>
  for_session(const std::string &session_id,
              const std::optional<model::EventType> &type = std::nullopt);

  /// Latest events across every session of a project, newest first.
  [[nodiscard]] common::Result<std::vector<model::SessionEvent>>
  recent(const std::string &project_path, const std::optional<model::EventType> &type,
         std::size_t limit);

private:
  Database *db_;
};

} // namespace synmem::storage
