#include "synmem/config/config.hpp"

#include "synmem/common/fs.hpp"
#include "synmem/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace synmem::config {

namespace {

constexpr const char *DATA_FOLDER = ".synmem";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *STORE_FILENAME = "memory.db";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SYNMEM_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

/// Non-positive counts become 0 so that validate_config reports them.
common::Status read_count(const common::TomlDocument &doc, const std::string &key,
                          std::size_t &target) {
  const auto value = doc.integer_at(key);
  if (!value.ok()) {
    return value.status();
  }
  if (value.value().has_value()) {
    target = *value.value() > 0 ? static_cast<std::size_t>(*value.value()) : 0;
  }
  return common::Status::success();
}

common::Status read_text(const common::TomlDocument &doc, const std::string &key,
                         std::string &target) {
  const auto value = doc.string_at(key);
  if (!value.ok()) {
    return value.status();
  }
  if (value.value().has_value()) {
    target = *value.value();
  }
  return common::Status::success();
}

} // namespace

common::Result<std::filesystem::path> data_dir() {
  if (const char *env = std::getenv("SYNMEM_DIR"); env != nullptr && *env != '\0') {
    return common::ensure_dir(std::filesystem::path(common::expand_path(env)));
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error(), home.code());
  }
  return common::ensure_dir(home.value() / DATA_FOLDER);
}

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }

    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  return data_dir();
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error(), cfg_dir.code());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

common::Result<std::filesystem::path> store_path(const Config &config) {
  const char *env = std::getenv("SYNMEM_DIR");
  const bool env_set = env != nullptr && *env != '\0';
  if (!env_set && !common::trim(config.store.path).empty()) {
    const std::filesystem::path path(common::expand_path(common::trim(config.store.path)));
    if (path == ":memory:") {
      return common::Result<std::filesystem::path>::success(path);
    }
    if (!path.parent_path().empty()) {
      auto ensured = common::ensure_dir(path.parent_path());
      if (!ensured.ok()) {
        return ensured;
      }
    }
    return common::Result<std::filesystem::path>::success(path);
  }

  const auto dir = data_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / STORE_FILENAME);
}

void apply_env_overrides(Config &config) {
  if (const char *backend = std::getenv("SYNMEM_OBSERVABILITY");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error(), parsed.code());
  }

  const auto &doc = parsed.value();
  Config config;
  for (const auto &status :
       {read_text(doc, "store.path", config.store.path),
        read_count(doc, "context.recent_sessions", config.context.recent_sessions),
        read_count(doc, "context.knowledge_items", config.context.knowledge_items),
        read_count(doc, "context.important_files", config.context.important_files),
        read_text(doc, "observability.backend", config.observability.backend)}) {
    if (!status.ok()) {
      return common::Result<Config>::failure(status);
    }
  }

  const auto rate = doc.number_at("value.hourly_rate");
  if (!rate.ok()) {
    return common::Result<Config>::failure(rate.status());
  }
  config.value.hourly_rate = rate.value().value_or(config.value.hourly_rate);
  return common::Result<Config>::success(std::move(config));
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> problems;
  if (config.context.recent_sessions == 0) {
    problems.emplace_back("context.recent_sessions must be positive");
  }
  if (config.context.knowledge_items == 0) {
    problems.emplace_back("context.knowledge_items must be positive");
  }
  if (config.context.important_files == 0) {
    problems.emplace_back("context.important_files must be positive");
  }
  if (config.value.hourly_rate < 0.0) {
    problems.emplace_back("value.hourly_rate must not be negative");
  }
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty() && backend != "log" && backend != "none" && backend != "noop") {
    problems.emplace_back("observability.backend must be one of: log, none");
  }
  return problems;
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error(), cfg_path_result.code());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           common::ErrorCode::InvalidArgument);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           parsed.code());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);

  const auto problems = validate_config(config);
  if (!problems.empty()) {
    std::string message = "invalid config " + path.string() + ":";
    for (const auto &problem : problems) {
      message += " " + problem + ";";
    }
    return common::Result<Config>::failure(message, common::ErrorCode::InvalidArgument);
  }
  return common::Result<Config>::success(std::move(config));
}

} // namespace synmem::config
