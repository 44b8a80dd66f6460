#pragma once

#include "almanac/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace almanac::observability {

enum class LogLevel { Debug, Info, Warn, Error };

/// Writes one `[LEVEL] text` line per event. Lines below `min_level` are dropped.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(LogLevel min_level, std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void write(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream &out_;
  std::mutex write_mutex_;
};

} // namespace almanac::observability
