#include "synmem/common/toml.hpp"

#include "synmem/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace synmem::common {

namespace {

template <typename T>
Result<std::optional<T>> type_error(const std::string &key, const TomlEntry &entry,
                                    const std::string &expected) {
  return Result<std::optional<T>>::failure(key + " (line " + std::to_string(entry.line) +
                                               "): expected " + expected + ", got '" +
                                               entry.raw + "'",
                                           ErrorCode::InvalidArgument);
}

Result<TomlDocument> line_error(const std::size_t line, const std::string &what) {
  return Result<TomlDocument>::failure("line " + std::to_string(line) + ": " + what,
                                       ErrorCode::InvalidArgument);
}

/// Cuts a trailing `# comment`, ignoring `#` inside either quote style.
std::string without_comment(const std::string &line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote == '"' && ch == '\\') {
      ++i;
      continue;
    }
    if (quote != '\0') {
      if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

bool is_bare_key(const std::string &key) {
  if (key.empty()) {
    return false;
  }
  for (const char ch : key) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_' && ch != '-' &&
        ch != '.') {
      return false;
    }
  }
  return key.front() != '.' && key.back() != '.' && key.find("..") == std::string::npos;
}

/// Decodes a basic ("...") or literal ('...') string; nullopt when `raw` is neither.
std::optional<std::string> decode_string(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != raw.back() || (raw.front() != '"' && raw.front() != '\'')) {
    return std::nullopt;
  }
  const std::string body = raw.substr(1, raw.size() - 2);
  if (raw.front() == '\'') {
    if (body.find('\'') != std::string::npos) {
      return std::nullopt;
    }
    return body;
  }

  std::string out;
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (ch == '"') {
      return std::nullopt;
    }
    if (ch != '\\') {
      out.push_back(ch);
      continue;
    }
    if (++i >= body.size()) {
      return std::nullopt;
    }
    switch (body[i]) {
    case '"':
      out.push_back('"');
      break;
    case '\\':
      out.push_back('\\');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      return std::nullopt;
    }
  }
  return out;
}

/// TOML allows `_` between digits.
std::string strip_digit_separators(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '_' && i > 0 && i + 1 < raw.size() &&
        std::isdigit(static_cast<unsigned char>(raw[i - 1])) != 0 &&
        std::isdigit(static_cast<unsigned char>(raw[i + 1])) != 0) {
      continue;
    }
    out.push_back(raw[i]);
  }
  return out;
}

std::optional<std::int64_t> decode_integer(const std::string &raw) {
  std::string digits = strip_digit_separators(raw);
  if (!digits.empty() && digits.front() == '+') {
    digits.erase(0, 1);
  }
  if (digits.empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const char *first = digits.data();
  const char *last = first + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> decode_number(const std::string &raw) {
  if (const auto integer = decode_integer(raw); integer.has_value()) {
    return static_cast<double>(*integer);
  }
  const std::string digits = strip_digit_separators(raw);
  if (digits.empty() ||
      (std::isdigit(static_cast<unsigned char>(digits.back())) == 0 && digits.back() != '.')) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(digits.c_str(), &end);
  if (end != digits.c_str() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

bool TomlDocument::set(const std::string &key, TomlEntry entry) {
  return entries_.emplace(key, std::move(entry)).second;
}

bool TomlDocument::has(const std::string &key) const { return entries_.contains(key); }

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &[key, entry] : entries_) {
    out.push_back(key);
  }
  return out;
}

std::optional<std::size_t> TomlDocument::line_of(const std::string &key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.line;
}

Result<std::optional<std::string>> TomlDocument::string_at(const std::string &key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result<std::optional<std::string>>::success(std::nullopt);
  }
  auto decoded = decode_string(it->second.raw);
  if (!decoded.has_value()) {
    return type_error<std::string>(key, it->second, "a quoted string");
  }
  return Result<std::optional<std::string>>::success(std::move(decoded));
}

Result<std::optional<std::int64_t>> TomlDocument::integer_at(const std::string &key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result<std::optional<std::int64_t>>::success(std::nullopt);
  }
  const auto decoded = decode_integer(it->second.raw);
  if (!decoded.has_value()) {
    return type_error<std::int64_t>(key, it->second, "an integer");
  }
  return Result<std::optional<std::int64_t>>::success(decoded);
}

Result<std::optional<double>> TomlDocument::number_at(const std::string &key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result<std::optional<double>>::success(std::nullopt);
  }
  const auto decoded = decode_number(it->second.raw);
  if (!decoded.has_value()) {
    return type_error<double>(key, it->second, "a number");
  }
  return Result<std::optional<double>>::success(decoded);
}

Result<std::optional<bool>> TomlDocument::boolean_at(const std::string &key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result<std::optional<bool>>::success(std::nullopt);
  }
  if (it->second.raw == "true") {
    return Result<std::optional<bool>>::success(true);
  }
  if (it->second.raw == "false") {
    return Result<std::optional<bool>>::success(false);
  }
  return type_error<bool>(key, it->second, "true or false");
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string text;
  std::string section;
  std::size_t line = 0;

  while (std::getline(stream, text)) {
    ++line;
    const std::string clean = trim(without_comment(text));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (starts_with(clean, "[[")) {
        return line_error(line, "arrays of tables are not supported");
      }
      if (clean.back() != ']') {
        return line_error(line, "unterminated table header");
      }
      section = trim(clean.substr(1, clean.size() - 2));
      if (!is_bare_key(section)) {
        return line_error(line, "invalid table name '" + section + "'");
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return line_error(line, "expected 'key = value'");
    }
    const std::string key = trim(clean.substr(0, equals));
    const std::string raw = trim(clean.substr(equals + 1));
    if (!is_bare_key(key)) {
      return line_error(line, "invalid key '" + key + "'");
    }
    if (raw.empty()) {
      return line_error(line, "missing value for '" + key + "'");
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (const auto first = document.line_of(full_key); first.has_value()) {
      return line_error(line, "duplicate key '" + full_key + "' (first set at line " +
                                  std::to_string(*first) + ")");
    }
    document.set(full_key, TomlEntry{.raw = raw, .line = line});
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace synmem::common
