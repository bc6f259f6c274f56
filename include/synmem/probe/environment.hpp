#pragma once

#include "synmem/common/result.hpp"
#include "synmem/model/types.hpp"

#include <optional>
#include <string>

namespace synmem::probe {

inline constexpr const char *UNKNOWN_BRANCH = "unknown";

struct AgentIdentity {
  model::AgentType type = model::AgentType::Unknown;
  std::optional<std::string> version;
};

/// Ambient facts about the working copy and the calling agent.
class IEnvironmentProbe {
public:
  virtual ~IEnvironmentProbe() = default;

  /// Branch checked out in `dir`, or UNKNOWN_BRANCH when git cannot tell.
  [[nodiscard]] virtual std::string current_branch(const std::string &dir) = 0;
  [[nodiscard]] virtual std::optional<std::string> head_commit(const std::string &dir) = 0;
  [[nodiscard]] virtual AgentIdentity detect_agent() = 0;
};

/// Shells out to `git rev-parse` and reads agent version variables from the process env.
class SystemEnvironmentProbe final : public IEnvironmentProbe {
public:
  [[nodiscard]] std::string current_branch(const std::string &dir) override;
  [[nodiscard]] std::optional<std::string> head_commit(const std::string &dir) override;
  [[nodiscard]] AgentIdentity detect_agent() override;
};

/// First set of CLAUDE_CODE_VERSION, CURSOR_VERSION, AIDER_VERSION, OPENCLAW_VERSION wins.
[[nodiscard]] AgentIdentity detect_agent_from_env();

[[nodiscard]] common::Result<std::string> run_capture_command(const std::string &command);

[[nodiscard]] std::string shell_quote(const std::string &value);

} // namespace synmem::probe
