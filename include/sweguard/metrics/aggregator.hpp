#pragma once

#include "sweguard/harness/task_controller.hpp"
#include "sweguard/metrics/scorecard.hpp"

#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <variant>

namespace sweguard::metrics {

/// Owns the run's scorecard. Every change and query goes through a mailbox drained by a
/// single worker thread, so callers on any thread see a consistent fold.
class MetricsAggregator {
public:
  MetricsAggregator();
  ~MetricsAggregator();

  MetricsAggregator(const MetricsAggregator &) = delete;
  MetricsAggregator &operator=(const MetricsAggregator &) = delete;

  /// False once `finish` has been called.
  bool submit(harness::TaskOutcome outcome);
  /// Scorecard after every outcome submitted before this call.
  [[nodiscard]] Scorecard snapshot();
  /// Drains the mailbox, stops the worker and returns the final scorecard. Idempotent.
  [[nodiscard]] Scorecard finish();

private:
  struct Submit {
    harness::TaskOutcome outcome;
  };
  struct Query {
    std::shared_ptr<std::promise<Scorecard>> reply;
  };
  struct Stop {};
  using Message = std::variant<Submit, Query, Stop>;

  void worker_loop();

  std::mutex mutex_;
  std::mutex join_mutex_;
  std::condition_variable cv_;
  std::deque<Message> mailbox_;
  bool stopped_ = false;
  Scorecard scorecard_;
  std::thread worker_;
};

} // namespace sweguard::metrics
