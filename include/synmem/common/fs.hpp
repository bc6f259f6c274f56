#pragma once

#include "synmem/common/result.hpp"

#include <filesystem>
#include <string>

namespace synmem::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
/// Replace every run of whitespace with one space.
[[nodiscard]] std::string collapse_whitespace(const std::string &input);

[[nodiscard]] Result<std::filesystem::path> home_dir();
/// Creates `path` and its parents. Fails when something that is not a directory is in the way.
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
/// Expands a leading `~` and `$VAR` / `${VAR}` references. Unset variables expand to nothing.
[[nodiscard]] std::string expand_path(const std::string &value);

} // namespace synmem::common
