#include "tests/helpers/test_helpers.hpp"

#include "synmem/observability/global.hpp"
#include "synmem/storage/schema.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <stdexcept>

namespace synmem::testing {

common::TimePoint at(const std::string &iso) {
  const auto parsed = common::parse_iso(iso);
  if (!parsed.has_value()) {
    throw std::runtime_error("bad test timestamp: " + iso);
  }
  return *parsed;
}

std::string SequentialIds::next_id() {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d", ++counter_);
  return prefix_ + "-" + buffer;
}

std::unique_ptr<storage::Database> open_memory_store() {
  auto db = storage::open_store(":memory:");
  if (!db.ok()) {
    throw std::runtime_error("open_store failed: " + db.error());
  }
  return std::move(db.value());
}

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("synmem-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

ObserverScope::ObserverScope() {
  auto observer = std::make_unique<RecordingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverScope::~ObserverScope() { observability::set_global_observer(nullptr); }

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

} // namespace synmem::testing
