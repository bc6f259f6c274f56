#include "synmem/probe/environment.hpp"

#include "synmem/common/fs.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace synmem::probe {

namespace {

constexpr std::array<std::pair<const char *, model::AgentType>, 4> AGENT_VARIABLES{{
    {"CLAUDE_CODE_VERSION", model::AgentType::ClaudeCode},
    {"CURSOR_VERSION", model::AgentType::Cursor},
    {"AIDER_VERSION", model::AgentType::Aider},
    {"OPENCLAW_VERSION", model::AgentType::OpenClaw},
}};

std::optional<std::string> git_output(const std::string &dir, const std::string &args) {
  const auto output =
      run_capture_command("git -C " + shell_quote(dir) + " " + args + " 2>/dev/null");
  if (!output.ok()) {
    return std::nullopt;
  }
  const std::string value = common::trim(output.value());
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::string shell_quote(const std::string &value) {
  std::string quoted = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(ch);
    }
  }
  quoted += "'";
  return quoted;
}

common::Result<std::string> run_capture_command(const std::string &command) {
  std::array<char, 4096> buffer{};
  std::string output;
  FILE *pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return common::Result<std::string>::failure("failed to launch command");
  }

  while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
    output += buffer.data();
  }
  const int rc = pclose(pipe);
  if (rc != 0) {
    return common::Result<std::string>::failure("command failed with exit code " +
                                                std::to_string(rc));
  }
  return common::Result<std::string>::success(output);
}

AgentIdentity detect_agent_from_env() {
  for (const auto &[variable, type] : AGENT_VARIABLES) {
    if (const char *value = std::getenv(variable); value != nullptr && *value != '\0') {
      return AgentIdentity{.type = type, .version = std::string(value)};
    }
  }
  return AgentIdentity{};
}

std::string SystemEnvironmentProbe::current_branch(const std::string &dir) {
  return git_output(dir, "rev-parse --abbrev-ref HEAD").value_or(UNKNOWN_BRANCH);
}

std::optional<std::string> SystemEnvironmentProbe::head_commit(const std::string &dir) {
  return git_output(dir, "rev-parse HEAD");
}

AgentIdentity SystemEnvironmentProbe::detect_agent() { return detect_agent_from_env(); }

} // namespace synmem::probe
