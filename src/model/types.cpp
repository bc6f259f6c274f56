#include "synmem/model/types.hpp"

#include "synmem/common/json_util.hpp"

#include <sstream>
#include <type_traits>

namespace synmem::model {

namespace {

template <typename Enum, std::size_t N>
std::optional<Enum> lookup(const std::array<std::pair<std::string_view, Enum>, N> &table,
                           const std::string_view text) {
  for (const auto &[name, value] : table) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

constexpr std::array<std::pair<std::string_view, SessionStatus>, 3> SESSION_STATUSES{{
    {"active", SessionStatus::Active},
    {"completed", SessionStatus::Completed},
    {"abandoned", SessionStatus::Abandoned},
}};

constexpr std::array<std::pair<std::string_view, EventType>, 8> EVENT_TYPES{{
    {"file_read", EventType::FileRead},
    {"file_write", EventType::FileWrite},
    {"file_edit", EventType::FileEdit},
    {"tool_call", EventType::ToolCall},
    {"decision", EventType::Decision},
    {"pattern", EventType::Pattern},
    {"error_resolved", EventType::ErrorResolved},
    {"milestone", EventType::Milestone},
}};

constexpr std::array<std::pair<std::string_view, EventCategory>, EVENT_CATEGORY_COUNT>
    EVENT_CATEGORIES{{
        {"read", EventCategory::Read},
        {"search", EventCategory::Search},
        {"edit", EventCategory::Edit},
        {"execute", EventCategory::Execute},
        {"agent", EventCategory::Agent},
        {"other", EventCategory::Other},
    }};

constexpr std::array<std::pair<std::string_view, KnowledgeType>, 4> KNOWLEDGE_TYPES{{
    {"decision", KnowledgeType::Decision},
    {"pattern", KnowledgeType::Pattern},
    {"error_resolved", KnowledgeType::ErrorResolved},
    {"milestone", KnowledgeType::Milestone},
}};

constexpr std::array<std::pair<std::string_view, UsageType>, 3> USAGE_TYPES{{
    {"surfaced", UsageType::Surfaced},
    {"recalled", UsageType::Recalled},
    {"applied", UsageType::Applied},
}};

constexpr std::array<std::pair<std::string_view, AgentType>, 5> AGENT_TYPES{{
    {"claude-code", AgentType::ClaudeCode},
    {"cursor", AgentType::Cursor},
    {"aider", AgentType::Aider},
    {"openclaw", AgentType::OpenClaw},
    {"unknown", AgentType::Unknown},
}};

constexpr std::array<std::pair<std::string_view, FileOperation>, 3> FILE_OPERATIONS{{
    {"read", FileOperation::Read},
    {"write", FileOperation::Write},
    {"edit", FileOperation::Edit},
}};

template <typename Enum, std::size_t N>
std::string_view name_of(const std::array<std::pair<std::string_view, Enum>, N> &table,
                         const Enum value) {
  for (const auto &[name, candidate] : table) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

} // namespace

std::string_view to_string(const SessionStatus status) { return name_of(SESSION_STATUSES, status); }
std::string_view to_string(const EventType type) { return name_of(EVENT_TYPES, type); }
std::string_view to_string(const EventCategory category) {
  return name_of(EVENT_CATEGORIES, category);
}
std::string_view to_string(const KnowledgeType type) { return name_of(KNOWLEDGE_TYPES, type); }
std::string_view to_string(const UsageType type) { return name_of(USAGE_TYPES, type); }
std::string_view to_string(const AgentType type) { return name_of(AGENT_TYPES, type); }
std::string_view to_string(const FileOperation operation) {
  return name_of(FILE_OPERATIONS, operation);
}

std::optional<SessionStatus> session_status_from_string(const std::string_view text) {
  return lookup(SESSION_STATUSES, text);
}
std::optional<EventType> event_type_from_string(const std::string_view text) {
  return lookup(EVENT_TYPES, text);
}
std::optional<EventCategory> event_category_from_string(const std::string_view text) {
  return lookup(EVENT_CATEGORIES, text);
}
std::optional<KnowledgeType> knowledge_type_from_string(const std::string_view text) {
  return lookup(KNOWLEDGE_TYPES, text);
}
std::optional<UsageType> usage_type_from_string(const std::string_view text) {
  return lookup(USAGE_TYPES, text);
}
std::optional<AgentType> agent_type_from_string(const std::string_view text) {
  return lookup(AGENT_TYPES, text);
}
std::optional<FileOperation> file_operation_from_string(const std::string_view text) {
  return lookup(FILE_OPERATIONS, text);
}

std::string_view agent_display_name(const AgentType type) {
  switch (type) {
  case AgentType::ClaudeCode:
    return "Claude Code";
  case AgentType::Cursor:
    return "Cursor";
  case AgentType::Aider:
    return "Aider";
  case AgentType::OpenClaw:
    return "OpenClaw";
  case AgentType::Unknown:
    break;
  }
  return "Unknown Agent";
}

EventCategory categorize(const EventType type) {
  switch (type) {
  case EventType::FileRead:
    return EventCategory::Read;
  case EventType::FileWrite:
  case EventType::FileEdit:
    return EventCategory::Edit;
  case EventType::ToolCall:
    return EventCategory::Execute;
  case EventType::Decision:
  case EventType::Pattern:
  case EventType::ErrorResolved:
  case EventType::Milestone:
    break;
  }
  return EventCategory::Other;
}

EventType derive_event_type(const EventDetail &detail) {
  return std::visit(
      [](auto &&d) -> EventType {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, FileOpDetail>) {
          switch (d.operation) {
          case FileOperation::Read:
            return EventType::FileRead;
          case FileOperation::Write:
            return EventType::FileWrite;
          case FileOperation::Edit:
            break;
          }
          return EventType::FileEdit;
        } else if constexpr (std::is_same_v<T, ToolCallDetail>) {
          return EventType::ToolCall;
        } else if constexpr (std::is_same_v<T, DecisionDetail>) {
          return EventType::Decision;
        } else if constexpr (std::is_same_v<T, PatternDetail>) {
          return EventType::Pattern;
        } else if constexpr (std::is_same_v<T, ErrorResolvedDetail>) {
          return EventType::ErrorResolved;
        } else {
          return EventType::Milestone;
        }
      },
      detail);
}

std::string encode_detail(const EventDetail &detail) {
  return std::visit(
      [](auto &&d) -> std::string {
        using T = std::decay_t<decltype(d)>;
        std::ostringstream out;
        if constexpr (std::is_same_v<T, FileOpDetail>) {
          out << "{\"type\":\"file_op\",\"path\":" << common::json_quote(d.path)
              << ",\"operation\":\"" << to_string(d.operation) << "\"}";
        } else if constexpr (std::is_same_v<T, ToolCallDetail>) {
          out << "{\"type\":\"tool_call\",\"toolName\":" << common::json_quote(d.tool_name);
          if (d.params.has_value()) {
            out << ",\"params\":" << common::json_quote(*d.params);
          }
          out << "}";
        } else if constexpr (std::is_same_v<T, DecisionDetail>) {
          out << "{\"type\":\"decision\",\"title\":" << common::json_quote(d.title)
              << ",\"rationale\":" << common::json_quote(d.rationale) << "}";
        } else if constexpr (std::is_same_v<T, PatternDetail>) {
          out << "{\"type\":\"pattern\",\"description\":"
              << common::json_quote(d.description)
              << ",\"files\":" << common::json_string_array(d.files) << "}";
        } else if constexpr (std::is_same_v<T, ErrorResolvedDetail>) {
          out << "{\"type\":\"error_resolved\",\"error\":" << common::json_quote(d.error)
              << ",\"resolution\":" << common::json_quote(d.resolution)
              << ",\"files\":" << common::json_string_array(d.files) << "}";
        } else {
          out << "{\"type\":\"milestone\",\"summary\":" << common::json_quote(d.summary) << "}";
        }
        return out.str();
      },
      detail);
}

common::Result<EventDetail> decode_detail(const std::string &json) {
  auto parsed = common::parse_json_object(json);
  if (!parsed.ok()) {
    return common::Result<EventDetail>::failure(parsed.status());
  }
  const common::JsonObject &object = parsed.value();

  // Required members are collected by name so one error can list every gap.
  std::vector<std::string> missing;
  const auto text = [&object, &missing](const std::string &key) {
    const auto value = object.string(key);
    if (!value.has_value()) {
      missing.push_back(key);
    }
    return value.value_or("");
  };
  const auto list = [&object, &missing](const std::string &key) {
    const auto it = object.members.find(key);
    if (it == object.members.end() || it->second.kind != common::JsonValue::Kind::StringArray) {
      missing.push_back(key);
      return std::vector<std::string>{};
    }
    return it->second.items;
  };

  const std::string type = object.string("type").value_or("");
  EventDetail detail;
  if (type == "file_op") {
    const auto path = object.string("path");
    if (!path.has_value()) {
      return common::Result<EventDetail>::failure("file_op detail requires a path",
                                                  common::ErrorCode::InvalidArgument);
    }
    const auto operation = file_operation_from_string(object.string("operation").value_or(""));
    if (!operation.has_value()) {
      return common::Result<EventDetail>::failure(
          "file_op operation must be one of: read, write, edit",
          common::ErrorCode::InvalidArgument);
    }
    detail = FileOpDetail{.path = *path, .operation = *operation};
  } else if (type == "tool_call") {
    ToolCallDetail tool{.tool_name = text("toolName"), .params = std::nullopt};
    if (object.has("params")) {
      tool.params = text("params");
    }
    detail = std::move(tool);
  } else if (type == "decision") {
    detail = DecisionDetail{.title = text("title"), .rationale = text("rationale")};
  } else if (type == "pattern") {
    detail = PatternDetail{.description = text("description"), .files = list("files")};
  } else if (type == "error_resolved") {
    detail = ErrorResolvedDetail{
        .error = text("error"), .resolution = text("resolution"), .files = list("files")};
  } else if (type == "milestone") {
    detail = MilestoneDetail{.summary = text("summary")};
  } else {
    return common::Result<EventDetail>::failure("unknown event detail type: '" + type + "'",
                                                common::ErrorCode::InvalidArgument);
  }

  if (!missing.empty()) {
    std::string message = type + " detail requires";
    for (std::size_t i = 0; i < missing.size(); ++i) {
      message += (i == 0 ? " " : ", ") + missing[i];
    }
    return common::Result<EventDetail>::failure(message, common::ErrorCode::InvalidArgument);
  }
  return common::Result<EventDetail>::success(std::move(detail));
}

std::optional<std::string> detail_file_path(const EventDetail &detail) {
  if (const auto *file_op = std::get_if<FileOpDetail>(&detail); file_op != nullptr) {
    return file_op->path;
  }
  return std::nullopt;
}

} // namespace synmem::model
