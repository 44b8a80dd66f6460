#include "almanac/observability/factory.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/observability/log_observer.hpp"

namespace almanac::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend == "debug") {
    return std::make_unique<LogObserver>(LogLevel::Debug);
  }
  if (backend == "errors") {
    return std::make_unique<LogObserver>(LogLevel::Warn);
  }
  return std::make_unique<LogObserver>(LogLevel::Info);
}

} // namespace almanac::observability
