#include "synmem/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace synmem::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

/// Single forward pass over one JSON text.
class Reader {
public:
  explicit Reader(const std::string &text) : text_(text) {}

  template <typename T> Result<T> fail(const std::string &what) const {
    return Result<T>::failure("malformed JSON at offset " + std::to_string(pos_) + ": " + what,
                              ErrorCode::InvalidArgument);
  }

  char peek() {
    skip_ws();
    return pos_ < text_.size() ? text_[pos_] : '\0';
  }

  bool consume(const char ch) {
    if (peek() != ch) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool at_end() {
    skip_ws();
    return pos_ >= text_.size();
  }

  Result<std::string> read_string() {
    if (!consume('"')) {
      return fail<std::string>("expected a string");
    }
    std::string out;
    while (pos_ < text_.size()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return Result<std::string>::success(std::move(out));
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (pos_ >= text_.size()) {
        break;
      }
      const char escaped = text_[pos_++];
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        out.push_back(escaped);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        auto code_point = read_hex4();
        if (!code_point.has_value()) {
          return fail<std::string>("bad \\u escape");
        }
        // High surrogate: the low half must follow.
        if (*code_point >= 0xD800 && *code_point <= 0xDBFF && pos_ + 1 < text_.size() &&
            text_[pos_] == '\\' && text_[pos_ + 1] == 'u') {
          pos_ += 2;
          const auto low = read_hex4();
          if (!low.has_value() || *low < 0xDC00 || *low > 0xDFFF) {
            return fail<std::string>("unpaired surrogate");
          }
          *code_point = 0x10000 + ((*code_point - 0xD800) << 10) + (*low - 0xDC00);
        }
        append_utf8(out, *code_point);
        break;
      }
      default:
        return fail<std::string>(std::string("unknown escape \\") + escaped);
      }
    }
    return fail<std::string>("unterminated string");
  }

  Result<std::vector<std::string>> read_string_array() {
    if (!consume('[')) {
      return fail<std::vector<std::string>>("expected an array");
    }
    std::vector<std::string> items;
    if (consume(']')) {
      return Result<std::vector<std::string>>::success(std::move(items));
    }
    while (true) {
      auto item = read_string();
      if (!item.ok()) {
        return Result<std::vector<std::string>>::failure(item.status());
      }
      items.push_back(std::move(item.value()));
      if (consume(']')) {
        return Result<std::vector<std::string>>::success(std::move(items));
      }
      if (!consume(',')) {
        return fail<std::vector<std::string>>("expected ',' or ']'");
      }
    }
  }

  /// Number, true, false or null, returned verbatim.
  Result<std::string> read_scalar() {
    skip_ws();
    const std::size_t start = pos_;
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '-' && ch != '+' &&
          ch != '.') {
        break;
      }
      ++pos_;
    }
    const std::string token = text_.substr(start, pos_ - start);
    if (token.empty()) {
      return fail<std::string>("expected a value");
    }
    if (token == "true" || token == "false" || token == "null") {
      return Result<std::string>::success(token);
    }
    char *end = nullptr;
    (void)std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size()) {
      return fail<std::string>("unexpected token '" + token + "'");
    }
    return Result<std::string>::success(token);
  }

private:
  void skip_ws() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  std::optional<std::uint32_t> read_hex4() {
    if (pos_ + 4 > text_.size()) {
      return std::nullopt;
    }
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
      const char ch = text_[pos_++];
      value <<= 4;
      if (ch >= '0' && ch <= '9') {
        value |= static_cast<std::uint32_t>(ch - '0');
      } else if (ch >= 'a' && ch <= 'f') {
        value |= static_cast<std::uint32_t>(ch - 'a' + 10);
      } else if (ch >= 'A' && ch <= 'F') {
        value |= static_cast<std::uint32_t>(ch - 'A' + 10);
      } else {
        return std::nullopt;
      }
    }
    return value;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

} // namespace

std::optional<std::string> JsonObject::string(const std::string &key) const {
  const auto it = members.find(key);
  if (it == members.end() || it->second.kind != JsonValue::Kind::String) {
    return std::nullopt;
  }
  return it->second.text;
}

std::vector<std::string> JsonObject::strings(const std::string &key) const {
  const auto it = members.find(key);
  if (it == members.end() || it->second.kind != JsonValue::Kind::StringArray) {
    return {};
  }
  return it->second.items;
}

std::string json_escape(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 2);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        out += buffer;
      } else {
        out.push_back(ch);
      }
    }
  }
  return out;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += json_quote(values[i]);
  }
  out += "]";
  return out;
}

Result<JsonObject> parse_json_object(const std::string &text) {
  Reader reader(text);
  if (!reader.consume('{')) {
    return reader.fail<JsonObject>("expected an object");
  }

  JsonObject object;
  if (!reader.consume('}')) {
    while (true) {
      auto key = reader.read_string();
      if (!key.ok()) {
        return Result<JsonObject>::failure(key.status());
      }
      if (!reader.consume(':')) {
        return reader.fail<JsonObject>("expected ':' after \"" + key.value() + "\"");
      }

      JsonValue value;
      const char next = reader.peek();
      if (next == '"') {
        auto parsed = reader.read_string();
        if (!parsed.ok()) {
          return Result<JsonObject>::failure(parsed.status());
        }
        value.kind = JsonValue::Kind::String;
        value.text = std::move(parsed.value());
      } else if (next == '[') {
        auto parsed = reader.read_string_array();
        if (!parsed.ok()) {
          return Result<JsonObject>::failure(parsed.status());
        }
        value.kind = JsonValue::Kind::StringArray;
        value.items = std::move(parsed.value());
      } else if (next == '{') {
        return reader.fail<JsonObject>("nested objects are not supported");
      } else {
        auto parsed = reader.read_scalar();
        if (!parsed.ok()) {
          return Result<JsonObject>::failure(parsed.status());
        }
        value.kind = parsed.value() == "null" ? JsonValue::Kind::Null : JsonValue::Kind::Scalar;
        value.text = std::move(parsed.value());
      }
      object.members[key.value()] = std::move(value);

      if (reader.consume('}')) {
        break;
      }
      if (!reader.consume(',')) {
        return reader.fail<JsonObject>("expected ',' or '}'");
      }
    }
  }

  if (!reader.at_end()) {
    return reader.fail<JsonObject>("trailing characters");
  }
  return Result<JsonObject>::success(std::move(object));
}

Result<std::vector<std::string>> parse_json_string_array(const std::string &text) {
  Reader reader(text);
  if (reader.at_end()) {
    return Result<std::vector<std::string>>::success({});
  }
  auto items = reader.read_string_array();
  if (!items.ok()) {
    return items;
  }
  if (!reader.at_end()) {
    return reader.fail<std::vector<std::string>>("trailing characters");
  }
  return items;
}

} // namespace synmem::common
