#include "sweguard/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace sweguard::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, AttemptStartEvent>) {
          log_line("INFO", "attempt.start instance=" + evt.instance_id +
                               " attempt=" + std::to_string(evt.attempt));
        } else if constexpr (std::is_same_v<T, AttemptEndEvent>) {
          log_line("INFO", "attempt.end instance=" + evt.instance_id +
                               " attempt=" + std::to_string(evt.attempt) +
                               " outcome=" + evt.outcome + " turns=" + std::to_string(evt.turns) +
                               " tokens=" + std::to_string(evt.tokens) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, TurnEvent>) {
          log_line("DEBUG", "turn instance=" + evt.instance_id +
                                " attempt=" + std::to_string(evt.attempt) +
                                " turn=" + std::to_string(evt.turn) + " action=" + evt.action +
                                " exit=" + std::to_string(evt.exit_code) +
                                " timed_out=" + bool_text(evt.timed_out) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, PolicyDenialEvent>) {
          log_line("WARN", "policy.deny instance=" + evt.instance_id + " rule=" + evt.rule +
                               " reason=\"" + evt.reason + "\"");
        } else if constexpr (std::is_same_v<T, SandboxLifecycleEvent>) {
          log_line("DEBUG", "sandbox." + evt.phase + " id=" + evt.sandbox_id + " kind=" + evt.kind);
        } else if constexpr (std::is_same_v<T, ValidationEvent>) {
          log_line("INFO", "validation instance=" + evt.instance_id +
                               " applied=" + bool_text(evt.applied) +
                               " resolved=" + bool_text(evt.resolved) +
                               " passed=" + std::to_string(evt.passed) + "/" +
                               std::to_string(evt.total));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CommandLatencyMetric>) {
          log_line("DEBUG", "metric.command_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TokensUsedMetric>) {
          log_line("DEBUG", "metric.tokens_used=" + std::to_string(m.tokens));
        } else if constexpr (std::is_same_v<T, LiveSandboxesMetric>) {
          log_line("DEBUG", "metric.live_sandboxes=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace sweguard::observability
