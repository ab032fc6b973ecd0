#include "sweguard/observability/factory.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/observability/log_observer.hpp"
#include "sweguard/observability/noop_observer.hpp"

namespace sweguard::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace sweguard::observability
