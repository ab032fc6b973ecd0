#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sweguard::observability {

struct AttemptStartEvent {
  std::string instance_id;
  std::uint32_t attempt = 0;
};

struct AttemptEndEvent {
  std::string instance_id;
  std::uint32_t attempt = 0;
  std::string outcome;
  std::uint32_t turns = 0;
  std::uint64_t tokens = 0;
  std::chrono::milliseconds duration{0};
};

struct TurnEvent {
  std::string instance_id;
  std::uint32_t attempt = 0;
  std::uint32_t turn = 0;
  std::string action;
  int exit_code = 0;
  bool timed_out = false;
  std::chrono::milliseconds duration{0};
};

struct PolicyDenialEvent {
  std::string instance_id;
  std::string rule;
  std::string reason;
};

struct SandboxLifecycleEvent {
  std::string sandbox_id;
  std::string kind;
  std::string phase;
};

struct ValidationEvent {
  std::string instance_id;
  bool applied = false;
  bool resolved = false;
  std::size_t passed = 0;
  std::size_t total = 0;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<AttemptStartEvent, AttemptEndEvent, TurnEvent, PolicyDenialEvent,
                 SandboxLifecycleEvent, ValidationEvent, WarningEvent, ErrorEvent>;

struct CommandLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TokensUsedMetric {
  std::uint64_t tokens = 0;
};

struct LiveSandboxesMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<CommandLatencyMetric, TokensUsedMetric, LiveSandboxesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sweguard::observability
