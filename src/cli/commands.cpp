#include "synmem/cli/commands.hpp"

#include "synmem/cli/report.hpp"
#include "synmem/common/clock.hpp"
#include "synmem/common/fs.hpp"
#include "synmem/config/config.hpp"
#include "synmem/observability/factory.hpp"
#include "synmem/observability/global.hpp"
#include "synmem/probe/environment.hpp"
#include "synmem/service/session_service.hpp"
#include "synmem/storage/schema.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace synmem::cli {

namespace {

std::string version_string() {
#ifdef SYNMEM_VERSION
  std::string version = SYNMEM_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "synmem " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::optional<std::string> take_optional(std::vector<std::string> &args,
                                         const std::string &long_name,
                                         const std::string &short_name = "") {
  std::string value;
  if (take_option(args, long_name, short_name, value)) {
    return value;
  }
  return std::nullopt;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::vector<std::string> split_list(const std::string &value) {
  std::vector<std::string> out;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = common::trim(item);
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

std::optional<std::size_t> parse_count(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (end == nullptr || *end != '\0' || value == 0 || text[0] == '-') {
    return std::nullopt;
  }
  return static_cast<std::size_t>(value);
}

std::optional<double> parse_rate(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end == nullptr || *end != '\0' || value < 0.0) {
    return std::nullopt;
  }
  return value;
}

/// Everything a command needs: loaded config, migrated store and a wired service.
struct App {
  config::Config config;
  std::unique_ptr<storage::Database> db;
  common::SystemClock clock;
  common::RandomIdGenerator ids;
  probe::SystemEnvironmentProbe probe;
  std::unique_ptr<service::SessionService> service;
};

common::Result<std::unique_ptr<App>> open_app() {
  using AppResult = common::Result<std::unique_ptr<App>>;
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return AppResult::failure(cfg.error(), cfg.code());
  }

  auto app = std::make_unique<App>();
  app->config = std::move(cfg.value());
  observability::set_global_observer(observability::create_observer(app->config));

  const auto path = config::store_path(app->config);
  if (!path.ok()) {
    return AppResult::failure(path.error(), path.code());
  }
  auto db = storage::open_store(path.value());
  if (!db.ok()) {
    return AppResult::failure(db.error(), db.code());
  }
  app->db = std::move(db.value());
  app->service = std::make_unique<service::SessionService>(*app->db, app->clock, app->ids,
                                                           app->probe, app->config.context);
  return AppResult::success(std::move(app));
}

std::string resolve_project(std::vector<std::string> &args) {
  std::string project;
  if (take_option(args, "--project", "-p", project)) {
    return common::expand_path(project);
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  return ec ? std::string(".") : cwd.string();
}

int fail(const std::string &message) {
  std::cerr << message << "\n";
  return 1;
}

std::optional<model::EventDetail> build_detail(const model::EventType type,
                                               std::vector<std::string> &args,
                                               std::string &error) {
  const auto require = [&](const std::string &name) -> std::optional<std::string> {
    auto value = take_optional(args, name);
    if (!value.has_value()) {
      error = "missing " + name + " for " + std::string(model::to_string(type)) + " event";
    }
    return value;
  };

  switch (type) {
  case model::EventType::FileRead:
  case model::EventType::FileWrite:
  case model::EventType::FileEdit: {
    const auto path = require("--path");
    if (!path.has_value()) {
      return std::nullopt;
    }
    const auto operation = type == model::EventType::FileRead    ? model::FileOperation::Read
                           : type == model::EventType::FileWrite ? model::FileOperation::Write
                                                                 : model::FileOperation::Edit;
    return model::FileOpDetail{.path = *path, .operation = operation};
  }
  case model::EventType::ToolCall: {
    const auto tool = require("--tool");
    if (!tool.has_value()) {
      return std::nullopt;
    }
    return model::ToolCallDetail{.tool_name = *tool, .params = take_optional(args, "--params")};
  }
  case model::EventType::Decision: {
    const auto title = require("--title");
    const auto rationale = title.has_value() ? require("--rationale") : std::nullopt;
    if (!rationale.has_value()) {
      return std::nullopt;
    }
    return model::DecisionDetail{.title = *title, .rationale = *rationale};
  }
  case model::EventType::Pattern: {
    const auto description = require("--description");
    if (!description.has_value()) {
      return std::nullopt;
    }
    return model::PatternDetail{.description = *description,
                                .files = split_list(take_optional(args, "--files").value_or(""))};
  }
  case model::EventType::ErrorResolved: {
    const auto failure = require("--error");
    const auto resolution = failure.has_value() ? require("--resolution") : std::nullopt;
    if (!resolution.has_value()) {
      return std::nullopt;
    }
    return model::ErrorResolvedDetail{
        .error = *failure,
        .resolution = *resolution,
        .files = split_list(take_optional(args, "--files").value_or(""))};
  }
  case model::EventType::Milestone: {
    const auto summary = require("--summary");
    if (!summary.has_value()) {
      return std::nullopt;
    }
    return model::MilestoneDetail{.summary = *summary};
  }
  }
  error = "unsupported event type";
  return std::nullopt;
}

int run_start(std::vector<std::string> args) {
  service::StartSessionRequest request;
  request.project_path = resolve_project(args);
  request.branch = take_optional(args, "--branch", "-b");
  request.git_commit = take_optional(args, "--commit");
  request.agent_version = take_optional(args, "--agent-version");
  if (const auto agent = take_optional(args, "--agent"); agent.has_value()) {
    request.agent_type = model::agent_type_from_string(*agent);
    if (!request.agent_type.has_value()) {
      return fail("unknown agent type: " + *agent);
    }
  }

  auto app = open_app();
  if (!app.ok()) {
    return fail(app.error());
  }
  const auto context = app.value()->service->start_session(request);
  if (!context.ok()) {
    return fail(context.error());
  }
  std::cout << format_session_context(context.value()) << "\n";
  return 0;
}

int run_end(std::vector<std::string> args) {
  service::EndSessionRequest request;
  request.summary = take_optional(args, "--summary", "-s");
  request.git_commit = take_optional(args, "--commit");
  if (args.empty()) {
    return fail("usage: synmem end <session-id> [--summary TEXT] [--commit SHA]");
  }
  request.session_id = args[0];

  auto app = open_app();
  if (!app.ok()) {
    return fail(app.error());
  }
  const auto outcome = app.value()->service->end_session(request);
  if (!outcome.ok()) {
    return fail(outcome.error());
  }
  std::cout << format_session_end(outcome.value()) << "\n";
  return 0;
}

int run_event(std::vector<std::string> args) {
  const auto json = take_optional(args, "--json");
  if (args.empty() || (args.size() < 2 && !json.has_value())) {
    return fail("usage: synmem event <session-id> <type> [detail options] | "
                "synmem event <session-id> --json DETAIL");
  }

  service::RecordEventRequest request;
  request.session_id = args[0];
  if (args.size() >= 2) {
    request.declared_type = model::event_type_from_string(args[1]);
    if (!request.declared_type.has_value()) {
      return fail("unknown event type: " + args[1]);
    }
  }

  if (json.has_value()) {
    auto detail = model::decode_detail(*json);
    if (!detail.ok()) {
      return fail(detail.error());
    }
    request.detail = std::move(detail.value());
  } else {
    std::string error;
    auto detail = build_detail(*request.declared_type, args, error);
    if (!detail.has_value()) {
      return fail(error);
    }
    request.detail = std::move(*detail);
  }

  auto app = open_app();
  if (!app.ok()) {
    return fail(app.error());
  }
  const auto event = app.value()->service->record_event(request);
  if (!event.ok()) {
    return fail(event.error());
  }
  std::cout << format_event_recorded(event.value()) << "\n";
  return 0;
}

int run_promote(std::vector<std::string> args) {
  service::PromoteKnowledgeRequest request;
  request.project_path = resolve_project(args);
  request.allow_duplicate = take_flag(args, "--allow-duplicate");
  request.session_id = take_optional(args, "--session");
  request.source_event_id = take_optional(args, "--event");
  request.supersedes = take_optional(args, "--supersedes");
  request.tags = split_list(take_optional(args, "--tags").value_or(""));
  if (const auto type = take_optional(args, "--type", "-t"); type.has_value()) {
    const auto parsed = model::knowledge_type_from_string(*type);
    if (!parsed.has_value()) {
      return fail("unknown knowledge type: " + *type);
    }
    request.knowledge_type = *parsed;
  }
  const auto title = take_optional(args, "--title");
  const auto content = take_optional(args, "--content");
  if (!title.has_value() || !content.has_value()) {
    return fail("usage: synmem promote --title TEXT --content TEXT [--type TYPE] [--tags a,b] "
                "[--session ID] [--supersedes ID] [--allow-duplicate]");
  }
  request.title = *title;
  request.content = *content;

  auto app = open_app();
  if (!app.ok()) {
    return fail(app.error());
  }
  const auto outcome = app.value()->service->promote_knowledge(request);
  if (!outcome.ok()) {
    return fail(outcome.error());
  }
  std::cout << format_promotion(outcome.value(), request.supersedes) << "\n";
  return 0;
}

int run_knowledge(std::vector<std::string> args) {
  const std::string project = resolve_project(args);
  std::optional<model::KnowledgeType> type;
  if (const auto text = take_optional(args, "--type", "-t"); text.has_value()) {
    type = model::knowledge_type_from_string(*text);
    if (!type.has_value()) {
      return fail("unknown knowledge type: " + *text);
    }
  }
  std::size_t limit = 20;
  if (const auto text = take_optional(args, "--limit", "-n"); text.has_value()) {
    const auto parsed = parse_count(*text);
    if (!parsed.has_value()) {
      return fail("invalid --limit: " + *text);
    }
    limit = *parsed;
  }

  auto app = open_app();
  if (!app.ok()) {
    return fail(app.error());
  }
  const auto items = app.value()->service->get_knowledge(project, type, limit);
  if (!items.ok()) {
    return fail(items.error());
  }
  std::cout << format_knowledge_list(project, items.value()) << "\n";
  return 0;
}

int run_apply(std::vector<std::string> args) {
  const auto session = take_optional(args, "--session");
  if (args.empty() || !session.has_value()) {
    return fail("usage: synmem apply <knowledge-id> --session ID");
  }

  auto app = open_app();
  if (!app.ok()) {
    return fail(app.error());
  }
  const auto applied = app.value()->service->apply_knowledge(args[0], *session);
  if (!applied.ok()) {
    return fail(applied.error());
  }
  std::cout << format_applied(applied.value()) << "\n";
  return 0;
}

int run_recall(std::vector<std::string> args) {
  service::RecallRequest request;
  request.project_path = resolve_project(args);
  request.branch = take_optional(args, "--branch", "-b");
  request.session_id = take_optional(args, "--session");
  if (const auto text = take_optional(args, "--type", "-t"); text.has_value()) {
    request.event_type = model::event_type_from_string(*text);
    if (!request.event_type.has_value()) {
      return fail("unknown event type: " + *text);
    }
  }
  if (const auto text = take_optional(args, "--limit", "-n"); text.has_value()) {
    const auto parsed = parse_count(*text);
    if (!parsed.has_value()) {
      return fail("invalid --limit: " + *text);
    }
    request.limit = *parsed;
  }
  if (!args.empty()) {
    request.query = join_tokens(args);
  }

  auto app = open_app();
  if (!app.ok()) {
    return fail(app.error());
  }
  const auto result = app.value()->service->recall(request);
  if (!result.ok()) {
    return fail(result.error());
  }
  std::cout << format_recall(request, result.value()) << "\n";
  return 0;
}

int run_stats(std::vector<std::string> args) {
  const std::string project = resolve_project(args);
  service::StatsPeriod period = service::StatsPeriod::Week;
  if (const auto text = take_optional(args, "--period"); text.has_value()) {
    const auto parsed = service::stats_period_from_string(*text);
    if (!parsed.has_value()) {
      return fail("invalid --period: " + *text + " (expected day, week, month or all)");
    }
    period = *parsed;
  }

  auto app = open_app();
  if (!app.ok()) {
    return fail(app.error());
  }
  const auto stats = app.value()->service->stats(project, period);
  if (!stats.ok()) {
    return fail(stats.error());
  }
  std::cout << format_stats(project, stats.value()) << "\n";
  return 0;
}

int run_value(std::vector<std::string> args) {
  const std::string project = resolve_project(args);
  const auto rate_text = take_optional(args, "--rate");

  auto app = open_app();
  if (!app.ok()) {
    return fail(app.error());
  }
  double rate = app.value()->config.value.hourly_rate;
  if (rate_text.has_value()) {
    const auto parsed = parse_rate(*rate_text);
    if (!parsed.has_value()) {
      return fail("invalid --rate: " + *rate_text);
    }
    rate = *parsed;
  }
  const auto report = app.value()->service->value_report(project, rate);
  if (!report.ok()) {
    return fail(report.error());
  }
  std::cout << format_value_report(project, report.value()) << "\n";
  return 0;
}

int run_refresh_files(std::vector<std::string> args) {
  const std::string project = resolve_project(args);
  auto app = open_app();
  if (!app.ok()) {
    return fail(app.error());
  }
  const auto updated = app.value()->service->refresh_file_importance(project);
  if (!updated.ok()) {
    return fail(updated.error());
  }
  std::cout << "Rescored " << updated.value() << " file(s) for " << project << ".\n";
  return 0;
}

/// Runs a store command and reports its wall time once the observer is configured.
template <typename Fn> int timed(const std::string &operation, Fn &&fn) {
  const auto started = std::chrono::steady_clock::now();
  const int code = fn();
  observability::record_metric(observability::OperationLatencyMetric{
      .operation = operation,
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});
  return code;
}

int run_db_path() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  const auto path = config::store_path(cfg.value());
  if (!path.ok()) {
    return fail(path.error());
  }
  std::cout << path.value().string() << "\n";
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << " - session memory for coding agents\n\n";
  std::cout << "USAGE\n";
  std::cout << "  synmem [--config PATH] <command> [options]\n\n";
  std::cout << "SESSIONS\n";
  std::cout << "  start [--project DIR] [--branch B] [--commit SHA] [--agent TYPE]\n";
  std::cout << "                              Start a session and print surfaced context\n";
  std::cout << "  end <id> [--summary TEXT] [--commit SHA]\n";
  std::cout << "                              Complete a session and print its metrics\n";
  std::cout << "  event <id> <type> [--path P | --tool T | --title T --rationale R | ...]\n";
  std::cout << "  event <id> --json DETAIL    Record an event on an active session\n\n";
  std::cout << "KNOWLEDGE\n";
  std::cout << "  promote --title T --content C [--type TYPE] [--tags a,b] [--session ID]\n";
  std::cout << "          [--supersedes ID] [--allow-duplicate]\n";
  std::cout << "  knowledge [--type TYPE] [--limit N]\n";
  std::cout << "  apply <knowledge-id> --session ID\n";
  std::cout << "  recall [QUERY] [--branch B] [--type EVENT_TYPE] [--limit N] [--session ID]\n\n";
  std::cout << "REPORTS\n";
  std::cout << "  stats [--period day|week|month|all]\n";
  std::cout << "  value [--rate USD_PER_HOUR]\n";
  std::cout << "  refresh-files               Recompute file importance scores\n";
  std::cout << "  db-path                     Print the store location\n";
  std::cout << "  version\n\n";
  std::cout << "Every project command accepts --project DIR (default: current directory).\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "db-path") {
    return run_db_path();
  }
  using Command = int (*)(std::vector<std::string>);
  static const std::vector<std::pair<std::string, Command>> COMMANDS = {
      {"start", run_start},
      {"end", run_end},
      {"event", run_event},
      {"promote", run_promote},
      {"knowledge", run_knowledge},
      {"apply", run_apply},
      {"recall", run_recall},
      {"stats", run_stats},
      {"value", run_value},
      {"refresh-files", run_refresh_files},
  };
  for (const auto &entry : COMMANDS) {
    if (subcommand == entry.first) {
      const Command command = entry.second;
      return timed(entry.first, [&] { return command(std::move(args)); });
    }
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace synmem::cli
