#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace synmem::common {

using TimePoint = std::chrono::system_clock::time_point;

/// Source of "now" as sortable ISO-8601 UTC text (millisecond precision).
class IClock {
public:
  virtual ~IClock() = default;
  [[nodiscard]] virtual TimePoint now() const = 0;
  [[nodiscard]] std::string now_iso() const;
};

class SystemClock final : public IClock {
public:
  [[nodiscard]] TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/// Opaque unique identifiers for sessions, events, knowledge and usage rows.
class IIdGenerator {
public:
  virtual ~IIdGenerator() = default;
  [[nodiscard]] virtual std::string next_id() = 0;
};

/// RFC 4122 version 4 UUIDs from OpenSSL's CSPRNG.
///
/// When the byte source fails the id is drawn from a non-cryptographic PRNG instead and the
/// failure is reported through observability::record_error.
class RandomIdGenerator final : public IIdGenerator {
public:
  /// Fills the buffer; false on failure.
  using ByteSource = std::function<bool(unsigned char *, std::size_t)>;

  RandomIdGenerator();
  explicit RandomIdGenerator(ByteSource source) : source_(std::move(source)) {}

  [[nodiscard]] std::string next_id() override;

private:
  ByteSource source_;
};

[[nodiscard]] std::string format_iso(TimePoint point);

/// Accepts `YYYY-MM-DDTHH:MM:SS[.fff]Z` and SQLite's `YYYY-MM-DD HH:MM:SS`.
[[nodiscard]] std::optional<TimePoint> parse_iso(const std::string &text);

/// Fractional days from `earlier` to `later`; nullopt when `earlier` does not parse.
[[nodiscard]] std::optional<double> days_between(const std::string &earlier, TimePoint later);
[[nodiscard]] long long seconds_between(const std::string &earlier, const std::string &later);

} // namespace synmem::common
