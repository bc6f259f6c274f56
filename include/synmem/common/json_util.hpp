#pragma once

#include "synmem/common/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace synmem::common {

/// One member of a flat JSON object. Event details and tag lists never nest objects.
struct JsonValue {
  enum class Kind { String, StringArray, Scalar, Null };

  Kind kind = Kind::Null;
  /// String contents, or the literal text of a number / boolean.
  std::string text;
  std::vector<std::string> items;
};

struct JsonObject {
  std::map<std::string, JsonValue> members;

  [[nodiscard]] bool has(const std::string &key) const { return members.contains(key); }
  /// The member's text when it is a string, otherwise nullopt.
  [[nodiscard]] std::optional<std::string> string(const std::string &key) const;
  /// The member's items when it is an array of strings, otherwise empty.
  [[nodiscard]] std::vector<std::string> strings(const std::string &key) const;
};

[[nodiscard]] std::string json_escape(const std::string &value);
[[nodiscard]] std::string json_quote(const std::string &value);
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Parses `{...}` whose members are strings, arrays of strings, numbers, booleans or null.
/// Failures carry ErrorCode::InvalidArgument and the byte offset of the problem.
[[nodiscard]] Result<JsonObject> parse_json_object(const std::string &text);
/// Parses `["a","b"]`. Blank input is an empty list.
[[nodiscard]] Result<std::vector<std::string>> parse_json_string_array(const std::string &text);

} // namespace synmem::common
