#include "test_framework.hpp"

#include "synmem/model/types.hpp"

void register_model_tests(std::vector<synmem::tests::TestCase> &tests) {
  using synmem::tests::require;
  namespace m = synmem::model;
  namespace c = synmem::common;

  tests.push_back({"model_enum_names_round_trip", [] {
                     for (const auto type :
                          {m::EventType::FileRead, m::EventType::FileWrite, m::EventType::FileEdit,
                           m::EventType::ToolCall, m::EventType::Decision, m::EventType::Pattern,
                           m::EventType::ErrorResolved, m::EventType::Milestone}) {
                       const auto parsed = m::event_type_from_string(m::to_string(type));
                       require(parsed.has_value() && *parsed == type,
                               "event type should round trip: " +
                                   std::string(m::to_string(type)));
                     }
                     require(m::to_string(m::KnowledgeType::ErrorResolved) == "error_resolved",
                             "knowledge type name");
                     require(m::to_string(m::AgentType::ClaudeCode) == "claude-code",
                             "agent type name");
                     require(!m::session_status_from_string("paused").has_value(),
                             "unknown status should not parse");
                     require(!m::usage_type_from_string("").has_value(), "empty usage type");
                   }});

  tests.push_back({"model_agent_display_names", [] {
                     require(m::agent_display_name(m::AgentType::ClaudeCode) == "Claude Code",
                             "claude display name");
                     require(m::agent_display_name(m::AgentType::Unknown) == "Unknown Agent",
                             "unknown display name");
                   }});

  tests.push_back({"model_categorize_event_types", [] {
                     require(m::categorize(m::EventType::FileRead) == m::EventCategory::Read,
                             "file_read is read");
                     require(m::categorize(m::EventType::FileWrite) == m::EventCategory::Edit,
                             "file_write is edit");
                     require(m::categorize(m::EventType::FileEdit) == m::EventCategory::Edit,
                             "file_edit is edit");
                     require(m::categorize(m::EventType::ToolCall) == m::EventCategory::Execute,
                             "tool_call is execute");
                     require(m::categorize(m::EventType::Decision) == m::EventCategory::Other,
                             "decision is other");
                     require(m::categorize(m::EventType::Milestone) == m::EventCategory::Other,
                             "milestone is other");
                   }});

  tests.push_back({"model_event_type_is_derived_from_detail", [] {
                     require(m::derive_event_type(m::FileOpDetail{
                                 .path = "a.cpp", .operation = m::FileOperation::Write}) ==
                                 m::EventType::FileWrite,
                             "write op derives file_write");
                     require(m::derive_event_type(m::FileOpDetail{
                                 .path = "a.cpp", .operation = m::FileOperation::Edit}) ==
                                 m::EventType::FileEdit,
                             "edit op derives file_edit");
                     require(m::derive_event_type(m::ErrorResolvedDetail{
                                 .error = "e", .resolution = "r", .files = {}}) ==
                                 m::EventType::ErrorResolved,
                             "error_resolved detail");
                   }});

  tests.push_back({"model_detail_encoding_uses_wire_keys", [] {
                     const std::string tool = m::encode_detail(
                         m::ToolCallDetail{.tool_name = "grep", .params = std::string("-rn")});
                     require(tool == R"({"type":"tool_call","toolName":"grep","params":"-rn"})",
                             "tool_call json: " + tool);
                     const std::string bare =
                         m::encode_detail(m::ToolCallDetail{.tool_name = "ls", .params = {}});
                     require(bare.find("params") == std::string::npos,
                             "absent params should not be written");

                     const auto decoded = m::decode_detail(m::encode_detail(m::PatternDetail{
                         .description = "RAII \"guards\"", .files = {"a.hpp", "b.cpp"}}));
                     require(decoded.ok(), decoded.error());
                     const auto *pattern = std::get_if<m::PatternDetail>(&decoded.value());
                     require(pattern != nullptr, "pattern expected");
                     require(pattern->description == "RAII \"guards\"", "quotes preserved");
                     require(pattern->files.size() == 2, "files preserved");
                   }});

  tests.push_back({"model_decode_rejects_malformed_details", [] {
                     const auto unknown = m::decode_detail(R"({"type":"telepathy"})");
                     require(!unknown.ok(), "unknown type should fail");
                     require(unknown.code() == c::ErrorCode::InvalidArgument, "argument error");

                     const auto no_path =
                         m::decode_detail(R"({"type":"file_op","operation":"read"})");
                     require(!no_path.ok(), "file_op without path should fail");

                     const auto bad_op =
                         m::decode_detail(R"({"type":"file_op","path":"x","operation":"delete"})");
                     require(!bad_op.ok(), "bad operation should fail");
                   }});

  tests.push_back({"model_decode_requires_every_member_of_the_detail_type", [] {
                     for (const std::string json :
                          {R"({"type":"decision"})", R"({"type":"decision","title":"t"})",
                           R"({"type":"tool_call"})", R"({"type":"tool_call","toolName":"x","params":3})",
                           R"({"type":"pattern","description":"d"})",
                           R"({"type":"pattern","description":"d","files":"a.cpp"})",
                           R"({"type":"error_resolved","error":"e","files":[]})",
                           R"({"type":"milestone","summary":null})"}) {
                       const auto decoded = m::decode_detail(json);
                       require(!decoded.ok(), "should reject: " + json);
                       require(decoded.code() == c::ErrorCode::InvalidArgument,
                               "argument error for: " + json);
                     }

                     const auto gaps = m::decode_detail(R"({"type":"error_resolved"})");
                     require(gaps.error() == "error_resolved detail requires error, resolution, files",
                             "every gap listed: " + gaps.error());

                     const auto minimal = m::decode_detail(
                         R"({"type":"pattern","description":"","files":[]})");
                     require(minimal.ok(), "empty values are still present: " + minimal.error());
                     const auto bare_tool = m::decode_detail(R"({"type":"tool_call","toolName":"ls"})");
                     require(bare_tool.ok(), "params is optional: " + bare_tool.error());
                   }});

  tests.push_back({"model_detail_file_path_only_for_file_ops", [] {
                     const m::EventDetail file =
                         m::FileOpDetail{.path = "src/a.cpp", .operation = m::FileOperation::Read};
                     require(m::detail_file_path(file) == std::optional<std::string>("src/a.cpp"),
                             "file op path");
                     const m::EventDetail milestone = m::MilestoneDetail{.summary = "done"};
                     require(!m::detail_file_path(milestone).has_value(), "no path for milestone");
                   }});

  tests.push_back({"model_session_metrics_category_lookup", [] {
                     m::SessionMetrics metrics;
                     metrics.events_by_category[static_cast<std::size_t>(m::EventCategory::Edit)] = 4;
                     require(metrics.category_count(m::EventCategory::Edit) == 4, "edit count");
                     require(metrics.category_count(m::EventCategory::Agent) == 0, "agent count");
                   }});
}
