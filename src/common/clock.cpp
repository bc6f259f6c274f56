#include "synmem/common/clock.hpp"

#include "synmem/observability/global.hpp"

#include <openssl/rand.h>

#include <array>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace synmem::common {

std::string IClock::now_iso() const { return format_iso(now()); }

RandomIdGenerator::RandomIdGenerator()
    : source_([](unsigned char *out, const std::size_t size) {
        return RAND_bytes(out, static_cast<int>(size)) == 1;
      }) {}

std::string RandomIdGenerator::next_id() {
  std::array<unsigned char, 16> bytes{};
  if (!source_(bytes.data(), bytes.size())) {
    observability::record_error("ids", "secure random source failed, using fallback PRNG");
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    for (auto &byte : bytes) {
      byte = static_cast<unsigned char>(rng() & 0xFF);
    }
  }

  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return stream.str();
}

std::string format_iso(const TimePoint point) {
  const auto t = std::chrono::system_clock::to_time_t(point);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          point.time_since_epoch())
                          .count() %
                      1000;
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis < 0 ? millis + 1000 : millis) << 'Z';
  return out.str();
}

std::optional<TimePoint> parse_iso(const std::string &text) {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  char sep = 0;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day, &sep, &hour,
                  &minute, &second, &consumed) != 7) {
    return std::nullopt;
  }
  if (sep != 'T' && sep != ' ') {
    return std::nullopt;
  }

  int millis = 0;
  std::size_t pos = static_cast<std::size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    int scale = 100;
    ++pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      millis += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  const std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

std::optional<double> days_between(const std::string &earlier, const TimePoint later) {
  const auto start = parse_iso(earlier);
  if (!start.has_value()) {
    return std::nullopt;
  }
  const auto age = later - *start;
  return std::chrono::duration_cast<std::chrono::duration<double>>(age).count() / 86400.0;
}

long long seconds_between(const std::string &earlier, const std::string &later) {
  const auto start = parse_iso(earlier);
  const auto end = parse_iso(later);
  if (!start.has_value() || !end.has_value()) {
    return 0;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(*end - *start).count();
}

} // namespace synmem::common
