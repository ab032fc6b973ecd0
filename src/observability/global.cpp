#include "sweguard/observability/global.hpp"

#include <mutex>

namespace sweguard::observability {

namespace {

// Held for the duration of each record call so observers never see concurrent writes.
std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->record_metric(metric);
  }
}

void record_sandbox(const std::string &sandbox_id, const std::string &kind,
                    const std::string &phase) {
  record_event(SandboxLifecycleEvent{.sandbox_id = sandbox_id, .kind = kind, .phase = phase});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace sweguard::observability
