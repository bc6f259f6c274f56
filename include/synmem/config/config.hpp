#pragma once

#include "synmem/common/result.hpp"
#include "synmem/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace synmem::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Directory that holds the store file: `$SYNMEM_DIR` or `~/.synmem`.
[[nodiscard]] common::Result<std::filesystem::path> data_dir();
/// Resolved store file path; `SYNMEM_DIR` wins over `[store] path`.
[[nodiscard]] common::Result<std::filesystem::path> store_path(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace synmem::config
