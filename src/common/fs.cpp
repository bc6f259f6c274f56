#include "synmem/common/fs.hpp"

#include <cctype>
#include <cstdlib>

namespace synmem::common {

namespace {

constexpr const char *WHITESPACE = " \t\n\r\f\v";

bool is_name_char(const char ch, const bool first) {
  const auto uch = static_cast<unsigned char>(ch);
  return ch == '_' || std::isalpha(uch) != 0 || (!first && std::isdigit(uch) != 0);
}

} // namespace

std::string trim(const std::string &input) {
  const std::size_t first = input.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) {
    return "";
  }
  const std::size_t last = input.find_last_not_of(WHITESPACE);
  return input.substr(first, last - first + 1);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string value) {
  for (char &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

std::string collapse_whitespace(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  bool in_space = false;
  for (const char ch : input) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      if (!in_space) {
        out.push_back(' ');
        in_space = true;
      }
      continue;
    }
    out.push_back(ch);
    in_space = false;
  }
  return out;
}

Result<std::filesystem::path> home_dir() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return Result<std::filesystem::path>::failure("HOME is not set", ErrorCode::InvalidArgument);
  }
  return Result<std::filesystem::path>::success(std::filesystem::path(home));
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec) && !std::filesystem::is_directory(path, ec)) {
    return Result<std::filesystem::path>::failure(path.string() + " exists and is not a directory",
                                                  ErrorCode::Precondition);
  }
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("cannot create directory " + path.string() +
                                                  ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  std::size_t i = 0;

  if (!value.empty() && value.front() == '~' && (value.size() == 1 || value[1] == '/')) {
    if (const auto home = home_dir(); home.ok()) {
      out = home.value().string();
      i = 1;
    }
  }

  while (i < value.size()) {
    if (value[i] != '$') {
      out.push_back(value[i++]);
      continue;
    }
    const bool braced = i + 1 < value.size() && value[i + 1] == '{';
    std::size_t start = i + (braced ? 2 : 1);
    std::size_t end = start;
    while (end < value.size() && is_name_char(value[end], end == start)) {
      ++end;
    }
    if (end == start || (braced && (end >= value.size() || value[end] != '}'))) {
      out.push_back(value[i++]);
      continue;
    }
    if (const char *var = std::getenv(value.substr(start, end - start).c_str()); var != nullptr) {
      out += var;
    }
    i = braced ? end + 1 : end;
  }
  return out;
}

} // namespace synmem::common
