#pragma once

#include "sweguard/config/schema.hpp"
#include "sweguard/observability/observer.hpp"

#include <memory>

namespace sweguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace sweguard::observability
