#pragma once

#include "sessionflow/config/schema.hpp"
#include "sessionflow/observability/observer.hpp"

#include <memory>

namespace sessionflow::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace sessionflow::observability
