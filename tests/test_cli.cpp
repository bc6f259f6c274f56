#include "test_framework.hpp"

#include "synmem/cli/commands.hpp"
#include "synmem/cli/report.hpp"
#include "synmem/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace m = synmem::model;
namespace svc = synmem::service;
using synmem::tests::require;

/// Redirects std::cout into a buffer for one scope.
class CaptureStdout {
public:
  CaptureStdout() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~CaptureStdout() { std::cout.rdbuf(previous_); }

  CaptureStdout(const CaptureStdout &) = delete;
  CaptureStdout &operator=(const CaptureStdout &) = delete;

  [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *previous_;
};

struct CliRun {
  int code = 0;
  std::string out;
};

CliRun run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = args;
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }
  CaptureStdout capture;
  const int code = synmem::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  return CliRun{.code = code, .out = capture.text()};
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

/// Isolated data directory with no config file and no agent hints in the environment.
struct CliSandbox {
  synmem::testing::TempDir home;
  synmem::testing::EnvGuard data_dir{"SYNMEM_DIR", (home.path() / "data").string()};
  synmem::testing::EnvGuard config_path{"SYNMEM_CONFIG_PATH", std::nullopt};
  synmem::testing::EnvGuard backend{"SYNMEM_OBSERVABILITY", std::nullopt};
  synmem::testing::EnvGuard claude{"CLAUDE_CODE_VERSION", std::nullopt};
  synmem::testing::EnvGuard cursor{"CURSOR_VERSION", std::nullopt};
  synmem::testing::EnvGuard aider{"AIDER_VERSION", std::nullopt};
  synmem::testing::EnvGuard openclaw{"OPENCLAW_VERSION", std::nullopt};

  CliSandbox() {
    synmem::config::clear_config_path_override();
    std::filesystem::create_directories(project());
  }

  [[nodiscard]] std::filesystem::path project() const { return home.path() / "project"; }
};

std::string first_line_value(const std::string &text, const std::string &prefix) {
  const auto start = text.find(prefix);
  if (start == std::string::npos) {
    return "";
  }
  const auto value_start = start + prefix.size();
  return text.substr(value_start, text.find('\n', value_start) - value_start);
}

} // namespace

void register_cli_tests(std::vector<synmem::tests::TestCase> &tests) {
  tests.push_back({"cli_format_duration", [] {
                     require(synmem::cli::format_duration(3900) == "1h 5m", "hours and minutes");
                     require(synmem::cli::format_duration(300) == "5m", "minutes only");
                     require(synmem::cli::format_duration(59) == "0m", "under a minute");
                   }});

  tests.push_back({"cli_format_detail_per_kind", [] {
                     using synmem::cli::format_detail;
                     require(format_detail(m::FileOpDetail{.path = "a.cpp",
                                                           .operation = m::FileOperation::Edit}) ==
                                 "edit a.cpp",
                             "file op");
                     require(format_detail(m::ToolCallDetail{.tool_name = "make",
                                                             .params = std::string("-j8")}) ==
                                 "make (-j8)",
                             "tool call");
                     require(format_detail(m::ErrorResolvedDetail{
                                 .error = "undefined symbol", .resolution = "link crypto", .files = {}}) ==
                                 "undefined symbol -> link crypto",
                             "error resolved");
                   }});

  tests.push_back({"cli_format_session_end", [] {
                     svc::EndSessionOutcome outcome;
                     outcome.session.session_id = "s1";
                     outcome.session.summary = "Shipped it";
                     outcome.metrics.duration_secs = 1500;
                     outcome.metrics.events_total = 7;
                     outcome.metrics.files_read = 3;
                     outcome.metrics.files_modified = 2;
                     outcome.metrics.decisions_recorded = 1;
                     require(synmem::cli::format_session_end(outcome) ==
                                 "Session s1 completed.\n\nDuration: 25 min\nEvents: 7\n"
                                 "Files read: 3 | modified: 2\nDecisions: 1 | Patterns: 0\n"
                                 "Errors resolved: 0\n\nSummary: Shipped it",
                             "end report layout");
                   }});

  tests.push_back({"cli_format_promotion_duplicate_and_success", [] {
                     svc::PromotionOutcome duplicate;
                     m::PromotedKnowledge existing;
                     existing.knowledge_id = "k1";
                     existing.title = "Use WAL";
                     duplicate.duplicate = synmem::context::DuplicateCandidate{
                         .existing = existing,
                         .similarity = 0.9,
                         .match = synmem::context::MatchType::TitleMatch};
                     const auto dup_text = synmem::cli::format_promotion(duplicate, std::nullopt);
                     require(contains(dup_text, "Duplicate detected (similar title, similarity: 90%):"),
                             "duplicate header");
                     require(contains(dup_text, "  Existing: [decision] Use WAL\n  ID: k1"),
                             "existing item");

                     svc::PromotionOutcome promoted;
                     existing.branch = "main";
                     promoted.promoted = existing;
                     promoted.project_total = 4;
                     require(synmem::cli::format_promotion(promoted, std::string("k0")) ==
                                 "Knowledge promoted: Use WAL (k1)\nType: decision\nBranch: main\n"
                                 "Project now has 4 promoted knowledge item(s).\nSuperseded: k0",
                             "promotion layout");
                   }});

  tests.push_back({"cli_format_knowledge_list", [] {
                     require(synmem::cli::format_knowledge_list("/p", {}) ==
                                 "No promoted knowledge found for /p.",
                             "empty list");
                     m::PromotedKnowledge k;
                     k.knowledge_id = "k1";
                     k.title = "Retry";
                     k.content = "Retry twice";
                     k.knowledge_type = m::KnowledgeType::Pattern;
                     k.tags = {"net", "io"};
                     k.usage_count = 3;
                     require(synmem::cli::format_knowledge_list("/p", {k}) ==
                                 "Project knowledge (1 items):\n\n[pattern] Retry\n  Retry twice\n"
                                 "  ID: k1\n  Tags: net, io\n  Used: 3 time(s)",
                             "item layout");
                   }});

  tests.push_back({"cli_format_recall_empty_results", [] {
                     svc::RecallRequest events_request{.project_path = "/p",
                                                       .event_type = m::EventType::FileRead};
                     svc::RecallResult events_only;
                     events_only.events_only = true;
                     require(synmem::cli::format_recall(events_request, events_only) ==
                                 "No file_read events found for /p.",
                             "no events");

                     svc::RecallRequest query{.project_path = "/p", .query = std::string("wal")};
                     require(synmem::cli::format_recall(query, svc::RecallResult{}) ==
                                 "No sessions found for /p matching \"wal\".",
                             "no sessions");
                   }});

  tests.push_back({"cli_format_value_report", [] {
                     require(synmem::cli::format_value_report("/p", std::nullopt) ==
                                 "No data yet for /p. Start a session to begin tracking value.",
                             "no data");
                     svc::ValueReport report;
                     report.metrics.total_sessions = 3;
                     report.summary.time_saved_minutes = 65;
                     report.summary.estimated_value_usd = 67.71;
                     report.hourly_rate = 62.5;
                     report.knowledge.total = 2;
                     report.knowledge.by_type[m::KnowledgeType::Decision] = 2;
                     const auto text = synmem::cli::format_value_report("/p", report);
                     require(contains(text, "--- synmem Value Report ---"), "header");
                     require(contains(text, "Sessions tracked: 3"), "sessions");
                     require(contains(text, "Knowledge items: 2 (2 decisions, 0 patterns, 0 errors resolved)"),
                             "knowledge breakdown");
                     require(contains(text, "  1h 5m saved (~$67.71 at $62.5/hr)"), "savings line");
                     require(contains(text, "  - Each error prevention: ~15 min saved"), "basis");
                   }});

  tests.push_back({"cli_version_and_help", [] {
                     const auto version = run_cli({"synmem", "--version"});
                     require(version.code == 0 && !version.out.empty(), "version prints");
                     const auto help = run_cli({"synmem", "help"});
                     require(help.code == 0 && contains(help.out, "USAGE"), "help prints usage");
                     const auto unknown = run_cli({"synmem", "frobnicate"});
                     require(unknown.code == 1, "unknown command fails");
                   }});

  tests.push_back({"cli_db_path_honours_data_dir", [] {
                     CliSandbox sandbox;
                     const auto printed = run_cli({"synmem", "db-path"});
                     require(printed.code == 0, "db-path succeeds");
                     require(printed.out == (sandbox.home.path() / "data" / "memory.db").string() + "\n",
                             "store lives under SYNMEM_DIR");
                   }});

  tests.push_back({"cli_session_flow_end_to_end", [] {
                     CliSandbox sandbox;
                     const std::string project = sandbox.project().string();

                     const auto started = run_cli({"synmem", "start", "--project", project,
                                                   "--branch", "main", "--agent", "aider"});
                     require(started.code == 0, "start succeeds");
                     const std::string id = first_line_value(started.out, "Session started: ");
                     require(!id.empty(), "session id printed");
                     require(contains(started.out, "Agent: Aider"), "agent line");

                     const auto decision = run_cli({"synmem", "event", id, "decision", "--title",
                                                    "Use WAL", "--rationale", "concurrent readers"});
                     require(decision.code == 0 && contains(decision.out, "Event recorded: decision ("),
                             "decision recorded");

                     const auto json = m::encode_detail(
                         m::FileOpDetail{.path = "src/db.cpp", .operation = m::FileOperation::Read});
                     const auto read = run_cli({"synmem", "event", id, "--json", json});
                     require(read.code == 0 && contains(read.out, "Event recorded: file_read ("),
                             "json detail recorded");

                     const auto missing_option = run_cli({"synmem", "event", id, "pattern"});
                     require(missing_option.code == 1, "pattern needs --description");

                     const auto ended =
                         run_cli({"synmem", "end", id, "--summary", "Moved storage to WAL"});
                     require(ended.code == 0, "end succeeds");
                     require(contains(ended.out, "Session " + id + " completed."), "end header");
                     require(contains(ended.out, "Events: 2"), "two events");
                     require(run_cli({"synmem", "end", id}).code == 1, "second end fails");

                     const auto promoted = run_cli({"synmem", "promote", "--project", project,
                                                    "--title", "Journal mode", "--content",
                                                    "Use WAL everywhere", "--type", "pattern",
                                                    "--tags", "sqlite,perf"});
                     require(promoted.code == 0 && contains(promoted.out, "Knowledge promoted: Journal mode"),
                             "promoted");
                     const auto duplicate = run_cli({"synmem", "promote", "--project", project,
                                                     "--title", "Other", "--content",
                                                     "use wal   EVERYWHERE"});
                     require(duplicate.code == 0 &&
                                 contains(duplicate.out,
                                          "Duplicate detected (identical content, similarity: 100%):"),
                             "duplicate reported");

                     const auto listed = run_cli({"synmem", "knowledge", "--project", project});
                     require(listed.code == 0 && contains(listed.out, "Project knowledge (1 items):") &&
                                 contains(listed.out, "  Tags: sqlite, perf"),
                             "knowledge listed");

                     const auto recalled = run_cli({"synmem", "recall", "WAL", "--project", project});
                     require(recalled.code == 0 && contains(recalled.out, "Found 1 session(s):") &&
                                 contains(recalled.out, "Matching knowledge (1):"),
                             "recall finds session and knowledge");

                     const auto stats = run_cli({"synmem", "stats", "--project", project, "--period", "all"});
                     require(stats.code == 0 && contains(stats.out, "Sessions: 1") &&
                                 contains(stats.out, "  Aider: 1"),
                             "stats");
                     require(run_cli({"synmem", "stats", "--project", project, "--period", "year"}).code == 1,
                             "bad period");

                     const auto value = run_cli({"synmem", "value", "--project", project, "--rate", "60"});
                     require(value.code == 0 && contains(value.out, "Sessions tracked: 1"), "value report");

                     const auto refreshed = run_cli({"synmem", "refresh-files", "--project", project});
                     require(refreshed.code == 0 && contains(refreshed.out, "file(s) for " + project),
                             "refresh files");
                   }});

  tests.push_back({"cli_value_without_sessions", [] {
                     CliSandbox sandbox;
                     const std::string project = sandbox.project().string();
                     const auto value = run_cli({"synmem", "value", "--project", project});
                     require(value.code == 0 && contains(value.out, "No data yet for " + project),
                             "empty value report");
                   }});
}
