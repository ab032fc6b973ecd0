#pragma once

#include "sweguard/observability/observer.hpp"

#include <ostream>

namespace sweguard::observability {

/// Writes one `[LEVEL] event key=value ...` line per event.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  std::ostream &out_;
};

} // namespace sweguard::observability
