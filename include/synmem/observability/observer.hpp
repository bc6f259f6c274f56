#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace synmem::observability {

struct MigrationAppliedEvent {
  int version = 0;
};

struct SessionStartedEvent {
  std::string session_id;
  std::string project_path;
  std::string branch;
  std::string agent_type;
};

struct SessionEndedEvent {
  std::string session_id;
  std::int64_t duration_secs = 0;
};

struct SessionsAbandonedEvent {
  std::string project_path;
  std::uint64_t count = 0;
};

struct KnowledgePromotedEvent {
  std::string knowledge_id;
  std::string knowledge_type;
};

struct DuplicateDetectedEvent {
  std::string existing_id;
  double similarity = 0.0;
  bool exact = false;
};

struct KnowledgeSurfacedEvent {
  std::string session_id;
  std::uint64_t count = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<MigrationAppliedEvent, SessionStartedEvent, SessionEndedEvent,
                 SessionsAbandonedEvent, KnowledgePromotedEvent, DuplicateDetectedEvent,
                 KnowledgeSurfacedEvent, ErrorEvent>;

struct SchemaVersionMetric {
  int version = 0;
};

struct OperationLatencyMetric {
  std::string operation;
  std::chrono::milliseconds latency{0};
};

struct FilesRescoredMetric {
  std::uint64_t count = 0;
};

using ObserverMetric =
    std::variant<SchemaVersionMetric, OperationLatencyMetric, FilesRescoredMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace synmem::observability
