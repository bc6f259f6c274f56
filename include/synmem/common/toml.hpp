#pragma once

#include "synmem/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace synmem::common {

/// Unparsed right-hand side of `key = value` and the line it came from.
struct TomlEntry {
  std::string raw;
  std::size_t line = 0;
};

/// Flat view of a TOML file keyed by `section.key`.
///
/// Values stay raw until read; the typed accessors report a missing key as an empty
/// optional and a value of the wrong shape as an InvalidArgument failure naming the line.
class TomlDocument {
public:
  /// False when the key already holds a value.
  bool set(const std::string &key, TomlEntry entry);

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::vector<std::string> keys() const;
  [[nodiscard]] std::optional<std::size_t> line_of(const std::string &key) const;

  [[nodiscard]] Result<std::optional<std::string>> string_at(const std::string &key) const;
  [[nodiscard]] Result<std::optional<std::int64_t>> integer_at(const std::string &key) const;
  /// Accepts integers and floats.
  [[nodiscard]] Result<std::optional<double>> number_at(const std::string &key) const;
  [[nodiscard]] Result<std::optional<bool>> boolean_at(const std::string &key) const;

private:
  std::map<std::string, TomlEntry> entries_;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace synmem::common
