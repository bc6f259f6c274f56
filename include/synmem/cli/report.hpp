#pragma once

#include "synmem/model/types.hpp"
#include "synmem/service/session_service.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace synmem::cli {

/// `2h 5m`, or `5m` under an hour.
[[nodiscard]] std::string format_duration(std::int64_t total_secs);
[[nodiscard]] std::string format_detail(const model::EventDetail &detail);

[[nodiscard]] std::string format_session_context(const service::SessionContext &context);
[[nodiscard]] std::string format_session_end(const service::EndSessionOutcome &outcome);
[[nodiscard]] std::string format_event_recorded(const model::SessionEvent &event);
[[nodiscard]] std::string format_promotion(const service::PromotionOutcome &outcome,
                                           const std::optional<std::string> &supersedes);
[[nodiscard]] std::string format_knowledge_list(const std::string &project_path,
                                                const std::vector<model::PromotedKnowledge> &items);
[[nodiscard]] std::string format_applied(const model::PromotedKnowledge &knowledge);
[[nodiscard]] std::string format_recall(const service::RecallRequest &request,
                                        const service::RecallResult &result);
[[nodiscard]] std::string format_stats(const std::string &project_path,
                                       const service::ProjectStats &stats);
[[nodiscard]] std::string format_value_report(const std::string &project_path,
                                              const std::optional<service::ValueReport> &report);

} // namespace synmem::cli
