#pragma once

#include "almanac/config/schema.hpp"
#include "almanac/observability/observer.hpp"

#include <memory>

namespace almanac::observability {

/// Maps `observability.backend`: "log" (info and up), "debug" (everything, including reminder
/// ticks), "errors" (warnings and errors only), "none"/"noop". Anything else logs at info.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace almanac::observability
