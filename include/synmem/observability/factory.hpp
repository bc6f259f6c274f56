#pragma once

#include "synmem/config/schema.hpp"
#include "synmem/observability/observer.hpp"

#include <memory>

namespace synmem::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace synmem::observability
