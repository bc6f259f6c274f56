#include "synmem/observability/factory.hpp"

#include "synmem/common/fs.hpp"
#include "synmem/observability/log_observer.hpp"
#include "synmem/observability/noop_observer.hpp"

namespace synmem::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace synmem::observability
