#include "synmem/cli/report.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace synmem::cli {

namespace {

std::string join_lines(const std::vector<std::string> &lines) {
  std::ostringstream out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out << '\n';
    }
    out << lines[i];
  }
  return out.str();
}

std::string join_comma(const std::vector<std::string> &values) {
  std::string out;
  for (const auto &value : values) {
    if (!out.empty()) {
      out += ", ";
    }
    out += value;
  }
  return out;
}

std::string fixed(const double value, const int digits) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(digits) << value;
  return out.str();
}

/// Shortest natural form: 50, 62.5.
std::string plain_number(const double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

std::string to_text(const std::string_view view) { return std::string(view); }

std::int64_t by_type(const storage::KnowledgeCount &count, const model::KnowledgeType type) {
  const auto it = count.by_type.find(type);
  return it == count.by_type.end() ? 0 : it->second;
}

} // namespace

std::string format_duration(const std::int64_t total_secs) {
  const std::int64_t hours = total_secs / 3600;
  const std::int64_t mins = (total_secs % 3600) / 60;
  if (hours > 0) {
    return std::to_string(hours) + "h " + std::to_string(mins) + "m";
  }
  return std::to_string(mins) + "m";
}

std::string format_detail(const model::EventDetail &detail) {
  return std::visit(
      [](const auto &value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, model::FileOpDetail>) {
          return to_text(model::to_string(value.operation)) + " " + value.path;
        } else if constexpr (std::is_same_v<T, model::ToolCallDetail>) {
          return value.params.has_value() && !value.params->empty()
                     ? value.tool_name + " (" + *value.params + ")"
                     : value.tool_name;
        } else if constexpr (std::is_same_v<T, model::DecisionDetail>) {
          return value.title + ": " + value.rationale;
        } else if constexpr (std::is_same_v<T, model::PatternDetail>) {
          return value.description;
        } else if constexpr (std::is_same_v<T, model::ErrorResolvedDetail>) {
          return value.error + " -> " + value.resolution;
        } else {
          return value.summary;
        }
      },
      detail);
}

std::string format_session_context(const service::SessionContext &context) {
  const auto &session = context.session;
  std::vector<std::string> lines = {
      "Session started: " + session.session_id,
      "Project: " + session.project_path,
      "Branch: " + session.branch,
  };
  std::string agent = "Agent: " + to_text(model::agent_display_name(session.agent_type));
  if (session.agent_version.has_value()) {
    agent += " " + *session.agent_version;
  }
  lines.push_back(agent);

  if (context.abandoned_count > 0) {
    lines.push_back("Cleaned up " + std::to_string(context.abandoned_count) +
                    " stale session(s).");
  }

  if (!context.recent_sessions.empty()) {
    lines.emplace_back("");
    lines.emplace_back("--- Recent Sessions ---");
    for (const auto &digest : context.recent_sessions) {
      const auto &recent = digest.scored.session;
      lines.push_back("[" + recent.started_at + "] " + recent.summary.value_or("(no summary)"));
      for (const auto &title : digest.decisions) {
        lines.push_back("  Decision: " + title);
      }
      for (const auto &description : digest.patterns) {
        lines.push_back("  Pattern: " + description);
      }
    }
  }

  if (!context.knowledge.empty()) {
    lines.emplace_back("");
    lines.emplace_back("--- Project Knowledge ---");
    for (const auto &scored : context.knowledge) {
      const auto &k = scored.knowledge;
      lines.push_back("[" + to_text(model::to_string(k.knowledge_type)) + "] " + k.title + ": " +
                      k.content);
    }
  }

  if (!context.important_files.empty()) {
    lines.emplace_back("");
    lines.emplace_back("--- Important Files ---");
    for (const auto &file : context.important_files) {
      lines.push_back(file.file_path + " (reads: " + std::to_string(file.read_count) +
                      ", edits: " + std::to_string(file.edit_count) +
                      ", score: " + fixed(file.importance_score, 2) + ")");
    }
  }
  return join_lines(lines);
}

std::string format_session_end(const service::EndSessionOutcome &outcome) {
  const auto &metrics = outcome.metrics;
  std::vector<std::string> lines = {
      "Session " + outcome.session.session_id + " completed.",
      "",
      "Duration: " + std::to_string(metrics.duration_secs / 60) + " min",
      "Events: " + std::to_string(metrics.events_total),
      "Files read: " + std::to_string(metrics.files_read) +
          " | modified: " + std::to_string(metrics.files_modified),
      "Decisions: " + std::to_string(metrics.decisions_recorded) +
          " | Patterns: " + std::to_string(metrics.patterns_discovered),
      "Errors resolved: " + std::to_string(metrics.errors_resolved),
  };
  if (outcome.session.summary.has_value() && !outcome.session.summary->empty()) {
    lines.emplace_back("");
    lines.push_back("Summary: " + *outcome.session.summary);
  }
  return join_lines(lines);
}

std::string format_event_recorded(const model::SessionEvent &event) {
  return "Event recorded: " + to_text(model::to_string(event.event_type)) + " (" +
         event.event_id + ")";
}

std::string format_promotion(const service::PromotionOutcome &outcome,
                             const std::optional<std::string> &supersedes) {
  if (outcome.duplicate.has_value()) {
    const auto &dup = *outcome.duplicate;
    const std::string match =
        dup.match == context::MatchType::ExactHash ? "identical content" : "similar title";
    return join_lines({
        "Duplicate detected (" + match + ", similarity: " +
            std::to_string(std::llround(dup.similarity * 100.0)) + "%):",
        "  Existing: [" + to_text(model::to_string(dup.existing.knowledge_type)) + "] " +
            dup.existing.title,
        "  ID: " + dup.existing.knowledge_id,
        "",
        "To promote anyway, pass --allow-duplicate",
        "To supersede the existing item, pass --supersedes <knowledge_id>",
    });
  }

  std::vector<std::string> lines;
  if (outcome.promoted.has_value()) {
    const auto &k = *outcome.promoted;
    lines.push_back("Knowledge promoted: " + k.title + " (" + k.knowledge_id + ")");
    lines.push_back("Type: " + to_text(model::to_string(k.knowledge_type)));
    if (k.branch.has_value()) {
      lines.push_back("Branch: " + *k.branch);
    }
  }
  lines.push_back("Project now has " + std::to_string(outcome.project_total) +
                  " promoted knowledge item(s).");
  if (supersedes.has_value()) {
    lines.push_back("Superseded: " + *supersedes);
  }
  return join_lines(lines);
}

std::string format_knowledge_list(const std::string &project_path,
                                  const std::vector<model::PromotedKnowledge> &items) {
  if (items.empty()) {
    return "No promoted knowledge found for " + project_path + ".";
  }
  std::vector<std::string> lines = {"Project knowledge (" + std::to_string(items.size()) +
                                    " items):"};
  for (const auto &k : items) {
    lines.emplace_back("");
    lines.push_back("[" + to_text(model::to_string(k.knowledge_type)) + "] " + k.title);
    lines.push_back("  " + k.content);
    lines.push_back("  ID: " + k.knowledge_id);
    if (!k.tags.empty()) {
      lines.push_back("  Tags: " + join_comma(k.tags));
    }
    if (k.usage_count > 0) {
      lines.push_back("  Used: " + std::to_string(k.usage_count) + " time(s)");
    }
  }
  return join_lines(lines);
}

std::string format_applied(const model::PromotedKnowledge &knowledge) {
  return "Applied [" + to_text(model::to_string(knowledge.knowledge_type)) + "] " +
         knowledge.title + " (used " + std::to_string(knowledge.usage_count) + " time(s))";
}

std::string format_recall(const service::RecallRequest &request,
                          const service::RecallResult &result) {
  std::vector<std::string> lines;
  if (result.events_only) {
    const std::string type =
        request.event_type.has_value() ? to_text(model::to_string(*request.event_type)) : "";
    if (result.events.empty()) {
      return "No " + type + " events found for " + request.project_path + ".";
    }
    lines.push_back("Recent " + type + " events (" + std::to_string(result.events.size()) + "):");
    for (const auto &event : result.events) {
      lines.push_back("  [" + event.timestamp + "] " + format_detail(event.detail));
    }
    return join_lines(lines);
  }

  const bool has_query = request.query.has_value() && !request.query->empty();
  if (result.sessions.empty()) {
    lines.push_back("No sessions found for " + request.project_path +
                    (has_query ? " matching \"" + *request.query + "\"" : std::string()) + ".");
  } else {
    lines.push_back("Found " + std::to_string(result.sessions.size()) + " session(s):");
    for (const auto &recalled : result.sessions) {
      const auto &s = recalled.session;
      lines.emplace_back("");
      lines.push_back("Session: " + s.session_id);
      lines.push_back("  Branch: " + s.branch + " | " + s.started_at +
                      (s.ended_at.has_value() ? " - " + *s.ended_at : std::string()));
      lines.push_back("  Status: " + to_text(model::to_string(s.status)));
      if (s.summary.has_value() && !s.summary->empty()) {
        lines.push_back("  Summary: " + *s.summary);
      }
      for (const auto &event : recalled.events) {
        lines.push_back("  [" + to_text(model::to_string(event.event_type)) + "] " +
                        format_detail(event.detail));
      }
    }
  }

  if (!result.knowledge.empty()) {
    lines.emplace_back("");
    lines.push_back("Matching knowledge (" + std::to_string(result.knowledge.size()) + "):");
    for (const auto &k : result.knowledge) {
      lines.push_back("  [" + to_text(model::to_string(k.knowledge_type)) + "] " + k.title + ": " +
                      k.content);
    }
  }
  return join_lines(lines);
}

std::string format_stats(const std::string &project_path, const service::ProjectStats &stats) {
  const auto &sessions = stats.sessions;
  std::vector<std::string> lines = {
      "Project stats for " + project_path + " (" + to_text(service::to_string(stats.period)) +
          "):",
      "",
      "Sessions: " + std::to_string(sessions.total_sessions),
      "Total time: " + format_duration(sessions.total_duration_secs),
      "Patterns discovered: " + std::to_string(sessions.patterns_discovered),
  };

  if (!sessions.top_files.empty()) {
    lines.emplace_back("");
    lines.emplace_back("Most-touched files:");
    for (const auto &file : sessions.top_files) {
      lines.push_back("  " + file.path + " (" + std::to_string(file.count) + ")");
    }
  }
  if (!sessions.category_breakdown.empty()) {
    lines.emplace_back("");
    lines.emplace_back("Event categories:");
    for (const auto &category : sessions.category_breakdown) {
      lines.push_back("  " + category.category + ": " + std::to_string(category.count));
    }
  }
  if (!stats.agents.empty()) {
    lines.emplace_back("");
    lines.emplace_back("Agents:");
    for (const auto &agent : stats.agents) {
      lines.push_back("  " + to_text(model::agent_display_name(agent.agent_type)) + ": " +
                      std::to_string(agent.session_count));
    }
  }
  const auto &usage = stats.usage;
  if (usage.surfaced + usage.recalled + usage.applied > 0) {
    lines.emplace_back("");
    lines.push_back("Knowledge usage: surfaced " + std::to_string(usage.surfaced) +
                    " | recalled " + std::to_string(usage.recalled) + " | applied " +
                    std::to_string(usage.applied));
  }
  return join_lines(lines);
}

std::string format_value_report(const std::string &project_path,
                                const std::optional<service::ValueReport> &report) {
  if (!report.has_value()) {
    return "No data yet for " + project_path + ". Start a session to begin tracking value.";
  }
  const auto &summary = report->summary;
  const auto &knowledge = report->knowledge;
  const std::int64_t hours = summary.time_saved_minutes / 60;
  const std::int64_t mins = summary.time_saved_minutes % 60;
  const std::string saved = hours > 0
                                ? std::to_string(hours) + "h " + std::to_string(mins) + "m"
                                : std::to_string(mins) + "m";
  using storage::TimeSavings;

  return join_lines({
      "--- synmem Value Report ---",
      "Project: " + project_path,
      "",
      "Sessions tracked: " + std::to_string(report->metrics.total_sessions),
      "Knowledge items: " + std::to_string(knowledge.total) + " (" +
          std::to_string(by_type(knowledge, model::KnowledgeType::Decision)) + " decisions, " +
          std::to_string(by_type(knowledge, model::KnowledgeType::Pattern)) + " patterns, " +
          std::to_string(by_type(knowledge, model::KnowledgeType::ErrorResolved)) +
          " errors resolved)",
      "",
      "Value delivered:",
      "  Knowledge surfaced: " + std::to_string(summary.knowledge_surfaced) +
          " times across sessions",
      "  Decisions recalled via search: " + std::to_string(summary.decisions_recalled) + " times",
      "  Patterns applied: " + std::to_string(summary.patterns_applied) + " times",
      "  Errors prevented (same error resolved before): " +
          std::to_string(summary.errors_prevented) + " times",
      "",
      "Time savings estimate:",
      "  " + saved + " saved (~$" + fixed(summary.estimated_value_usd, 2) + " at $" +
          plain_number(report->hourly_rate) + "/hr)",
      "",
      "Calculation basis:",
      "  - Each knowledge surface: ~" + std::to_string(TimeSavings::KNOWLEDGE_SURFACE / 60) +
          " min saved (context already there)",
      "  - Each decision recall: ~" + std::to_string(TimeSavings::DECISION_RECALL / 60) +
          " min saved (no re-research)",
      "  - Each pattern application: ~" + std::to_string(TimeSavings::PATTERN_APPLIED / 60) +
          " min saved (no re-discovery)",
      "  - Each error prevention: ~" + std::to_string(TimeSavings::ERROR_PREVENTED / 60) +
          " min saved (no re-debugging)",
  });
}

} // namespace synmem::cli
