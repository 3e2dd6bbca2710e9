#include "sessionflow/observability/factory.hpp"

#include "sessionflow/common/fs.hpp"
#include "sessionflow/observability/log_observer.hpp"
#include "sessionflow/observability/multi_observer.hpp"
#include "sessionflow/observability/noop_observer.hpp"

#include <sstream>

namespace sessionflow::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend,
                                         const config::Config &config) {
  if (backend == "log") {
    return std::make_unique<LogObserver>(false);
  }
  if (backend == "debug") {
    return std::make_unique<LogObserver>(true);
  }
  if (backend == "file") {
    const std::string path = common::trim(config.observability.log_file);
    if (path.empty()) {
      return nullptr;
    }
    auto observer = std::make_unique<LogObserver>(common::expand_path(path), true);
    if (!observer->is_open()) {
      return nullptr;
    }
    return observer;
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      multi->add(create_single(common::trim(part), config));
    }
    if (multi->size() == 0) {
      return std::make_unique<NoopObserver>();
    }
    return multi;
  }

  if (auto observer = create_single(backend, config)) {
    return observer;
  }
  return std::make_unique<LogObserver>(false);
}

} // namespace sessionflow::observability
