#pragma once

#include "synmem/common/clock.hpp"
#include "synmem/observability/observer.hpp"
#include "synmem/probe/environment.hpp"
#include "synmem/storage/database.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace synmem::testing {

/// Parses an ISO timestamp that the test itself wrote; throws when it does not parse.
common::TimePoint at(const std::string &iso);

/// Clock that only moves when told to.
class FixedClock final : public common::IClock {
public:
  explicit FixedClock(common::TimePoint start) : now_(start) {}
  explicit FixedClock(const std::string &iso) : now_(at(iso)) {}

  [[nodiscard]] common::TimePoint now() const override { return now_; }
  void set(common::TimePoint point) { now_ = point; }
  void advance(std::chrono::seconds delta) { now_ += delta; }

private:
  common::TimePoint now_;
};

/// `<prefix>-0001`, `<prefix>-0002`, ... in call order.
class SequentialIds final : public common::IIdGenerator {
public:
  explicit SequentialIds(std::string prefix = "id") : prefix_(std::move(prefix)) {}
  [[nodiscard]] std::string next_id() override;

private:
  std::string prefix_;
  int counter_ = 0;
};

class FakeProbe final : public probe::IEnvironmentProbe {
public:
  std::string branch = "main";
  std::optional<std::string> commit = "abc1234";
  probe::AgentIdentity agent;

  [[nodiscard]] std::string current_branch(const std::string &) override { return branch; }
  [[nodiscard]] std::optional<std::string> head_commit(const std::string &) override {
    return commit;
  }
  [[nodiscard]] probe::AgentIdentity detect_agent() override { return agent; }
};

/// Migrated in-memory store; throws when it cannot be opened.
std::unique_ptr<storage::Database> open_memory_store();

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

class RecordingObserver final : public observability::IObserver {
public:
  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;

  void record_event(const observability::ObserverEvent &event) override {
    events.push_back(event);
  }
  void record_metric(const observability::ObserverMetric &metric) override {
    metrics.push_back(metric);
  }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  template <typename T> [[nodiscard]] std::size_t count() const {
    std::size_t total = 0;
    for (const auto &event : events) {
      total += std::holds_alternative<T>(event) ? 1 : 0;
    }
    return total;
  }
};

/// Installs a RecordingObserver as the global observer for one scope.
class ObserverScope {
public:
  ObserverScope();
  ~ObserverScope();

  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

} // namespace synmem::testing
