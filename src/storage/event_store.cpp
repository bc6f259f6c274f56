#include "synmem/storage/event_store.hpp"

namespace synmem::storage {

namespace {

using EventList = common::Result<std::vector<model::SessionEvent>>;

common::Result<model::SessionEvent> event_from_row(const Statement &stmt) {
  auto detail = model::decode_detail(stmt.column_text(5));
  if (!detail.ok()) {
    return common::Result<model::SessionEvent>::failure(
        "event " + stmt.column_text(0) + " has unreadable detail: " + detail.error(),
        common::ErrorCode::Storage);
  }

  model::SessionEvent event;
  event.event_id = stmt.column_text(0);
  event.session_id = stmt.column_text(1);
  event.timestamp = stmt.column_text(2);
  event.event_type = model::event_type_from_string(stmt.column_text(3))
                         .value_or(model::derive_event_type(detail.value()));
  event.category = model::event_category_from_string(stmt.column_text(4))
                       .value_or(model::categorize(event.event_type));
  event.detail = std::move(detail.value());
  return common::Result<model::SessionEvent>::success(std::move(event));
}

EventList collect_events(Statement &stmt) {
  std::vector<model::SessionEvent> events;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    auto event = event_from_row(stmt);
    if (!event.ok()) {
      return EventList::failure(event.status());
    }
    events.push_back(std::move(event.value()));
  }
  if (rc != SQLITE_DONE) {
    return EventList::failure(stmt.error());
  }
  return EventList::success(std::move(events));
}

} // namespace

common::Status EventStore::insert(const model::SessionEvent &event) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  Statement stmt(*db_, R"(
INSERT INTO session_events (event_id, session_id, timestamp, event_type, category, detail_json)
VALUES (?1, ?2, ?3, ?4, ?5, ?6)
)");
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, event.event_id);
  stmt.bind(2, event.session_id);
  stmt.bind(3, event.timestamp);
  stmt.bind(4, std::string(model::to_string(event.event_type)));
  stmt.bind(5, std::string(model::to_string(event.category)));
  stmt.bind(6, model::encode_detail(event.detail));
  return stmt.run();
}

EventList EventStore::for_session(const std::string &session_id,
                                  const std::optional<model::EventType> &type) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  std::string sql = "SELECT event_id, session_id, timestamp, event_type, category, detail_json "
                    "FROM session_events WHERE session_id = ?1";
  if (type.has_value()) {
    sql += " AND event_type = ?2";
  }
  sql += " ORDER BY timestamp ASC, rowid ASC";

  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return EventList::failure(stmt.error());
  }
  stmt.bind(1, session_id);
  if (type.has_value()) {
    stmt.bind(2, std::string(model::to_string(*type)));
  }
  return collect_events(stmt);
}

EventList EventStore::recent(const std::string &project_path,
                             const std::optional<model::EventType> &type,
                             const std::size_t limit) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  std::string sql =
      "SELECT e.event_id, e.session_id, e.timestamp, e.event_type, e.category, e.detail_json "
      "FROM session_events e JOIN sessions s ON e.session_id = s.session_id "
      "WHERE s.project_path = ?1";
  if (type.has_value()) {
    sql += " AND e.event_type = ?3";
  }
  sql += " ORDER BY e.timestamp DESC, e.rowid DESC LIMIT ?2";

  Statement stmt(*db_, sql.c_str());
  if (!stmt.ok()) {
    return EventList::failure(stmt.error());
  }
  stmt.bind(1, project_path);
  stmt.bind(2, static_cast<std::int64_t>(limit));
  if (type.has_value()) {
    stmt.bind(3, std::string(model::to_string(*type)));
  }
  return collect_events(stmt);
}

} // namespace synmem::storage
