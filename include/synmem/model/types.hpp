#pragma once

#include "synmem/common/result.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace synmem::model {

enum class SessionStatus { Active, Completed, Abandoned };

enum class EventType {
  FileRead,
  FileWrite,
  FileEdit,
  ToolCall,
  Decision,
  Pattern,
  ErrorResolved,
  Milestone,
};

enum class EventCategory { Read, Search, Edit, Execute, Agent, Other };

inline constexpr std::size_t EVENT_CATEGORY_COUNT = 6;

enum class KnowledgeType { Decision, Pattern, ErrorResolved, Milestone };

enum class UsageType { Surfaced, Recalled, Applied };

enum class AgentType { ClaudeCode, Cursor, Aider, OpenClaw, Unknown };

enum class FileOperation { Read, Write, Edit };

enum class AccessType { Read, Edit };

[[nodiscard]] std::string_view to_string(SessionStatus status);
[[nodiscard]] std::string_view to_string(EventType type);
[[nodiscard]] std::string_view to_string(EventCategory category);
[[nodiscard]] std::string_view to_string(KnowledgeType type);
[[nodiscard]] std::string_view to_string(UsageType type);
[[nodiscard]] std::string_view to_string(AgentType type);
[[nodiscard]] std::string_view to_string(FileOperation operation);

[[nodiscard]] std::optional<SessionStatus> session_status_from_string(std::string_view text);
[[nodiscard]] std::optional<EventType> event_type_from_string(std::string_view text);
[[nodiscard]] std::optional<EventCategory> event_category_from_string(std::string_view text);
[[nodiscard]] std::optional<KnowledgeType> knowledge_type_from_string(std::string_view text);
[[nodiscard]] std::optional<UsageType> usage_type_from_string(std::string_view text);
[[nodiscard]] std::optional<AgentType> agent_type_from_string(std::string_view text);
[[nodiscard]] std::optional<FileOperation> file_operation_from_string(std::string_view text);

[[nodiscard]] std::string_view agent_display_name(AgentType type);
[[nodiscard]] EventCategory categorize(EventType type);

// Event detail payloads. The variant is closed: every event kind has exactly one shape.

struct FileOpDetail {
  std::string path;
  FileOperation operation = FileOperation::Read;
};

struct ToolCallDetail {
  std::string tool_name;
  std::optional<std::string> params;
};

struct DecisionDetail {
  std::string title;
  std::string rationale;
};

struct PatternDetail {
  std::string description;
  std::vector<std::string> files;
};

struct ErrorResolvedDetail {
  std::string error;
  std::string resolution;
  std::vector<std::string> files;
};

struct MilestoneDetail {
  std::string summary;
};

using EventDetail = std::variant<FileOpDetail, ToolCallDetail, DecisionDetail, PatternDetail,
                                 ErrorResolvedDetail, MilestoneDetail>;

[[nodiscard]] EventType derive_event_type(const EventDetail &detail);
[[nodiscard]] std::string encode_detail(const EventDetail &detail);
[[nodiscard]] common::Result<EventDetail> decode_detail(const std::string &json);
/// File path carried by a file operation detail, if any.
[[nodiscard]] std::optional<std::string> detail_file_path(const EventDetail &detail);

struct Session {
  std::string session_id;
  std::string project_path;
  std::string branch = "main";
  std::string started_at;
  std::optional<std::string> ended_at;
  SessionStatus status = SessionStatus::Active;
  std::optional<std::string> summary;
  std::optional<std::string> git_commit_start;
  std::optional<std::string> git_commit_end;
  AgentType agent_type = AgentType::Unknown;
  std::optional<std::string> agent_version;
};

struct SessionEvent {
  std::string event_id;
  std::string session_id;
  std::string timestamp;
  EventType event_type = EventType::Milestone;
  EventCategory category = EventCategory::Other;
  EventDetail detail;
};

struct PromotedKnowledge {
  std::string knowledge_id;
  std::string project_path;
  std::optional<std::string> session_id;
  std::optional<std::string> source_event_id;
  std::string title;
  std::string content;
  KnowledgeType knowledge_type = KnowledgeType::Decision;
  std::vector<std::string> tags;
  std::string created_at;
  std::optional<std::string> synced_at;
  std::optional<std::string> remote_knowledge_id;
  std::optional<std::string> branch;
  std::optional<std::string> content_hash;
  std::int64_t usage_count = 0;
  std::optional<std::string> superseded_by;
};

struct KnowledgeUsage {
  std::string usage_id;
  std::string knowledge_id;
  std::string session_id;
  UsageType usage_type = UsageType::Surfaced;
  std::string timestamp;
};

struct FileImportance {
  std::string project_path;
  std::string file_path;
  std::int64_t read_count = 0;
  std::int64_t edit_count = 0;
  std::string last_accessed_at;
  double importance_score = 0.0;
};

struct AgentInfo {
  AgentType agent_type = AgentType::Unknown;
  std::string display_name;
  std::string first_seen_at;
  std::string last_seen_at;
  std::int64_t total_sessions = 0;
};

struct ValueMetrics {
  std::string project_path;
  std::int64_t total_sessions = 0;
  std::int64_t context_reuse_count = 0;
  std::int64_t knowledge_surfaced_count = 0;
  std::int64_t decisions_recalled_count = 0;
  std::int64_t patterns_applied_count = 0;
  std::int64_t errors_prevented_count = 0;
  std::int64_t estimated_time_saved_secs = 0;
  std::string updated_at;
};

struct SessionMetrics {
  std::string session_id;
  std::int64_t duration_secs = 0;
  std::int64_t events_total = 0;
  std::array<std::int64_t, EVENT_CATEGORY_COUNT> events_by_category{};
  std::int64_t files_read = 0;
  std::int64_t files_modified = 0;
  std::int64_t decisions_recorded = 0;
  std::int64_t patterns_discovered = 0;
  std::int64_t errors_resolved = 0;

  [[nodiscard]] std::int64_t category_count(EventCategory category) const {
    return events_by_category[static_cast<std::size_t>(category)];
  }
};

} // namespace synmem::model
