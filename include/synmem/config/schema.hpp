#pragma once

#include <cstddef>
#include <string>

namespace synmem::config {

struct StoreConfig {
  /// Empty means `$SYNMEM_DIR/memory.db` or `~/.synmem/memory.db`.
  std::string path;
};

struct ContextConfig {
  std::size_t recent_sessions = 3;
  std::size_t knowledge_items = 10;
  std::size_t important_files = 5;
};

struct ValueConfig {
  double hourly_rate = 50.0;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  StoreConfig store;
  ContextConfig context;
  ValueConfig value;
  ObservabilityConfig observability;
};

} // namespace synmem::config
