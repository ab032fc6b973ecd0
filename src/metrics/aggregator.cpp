#include "sweguard/metrics/aggregator.hpp"

namespace sweguard::metrics {

MetricsAggregator::MetricsAggregator() : worker_([this] { worker_loop(); }) {}

MetricsAggregator::~MetricsAggregator() { (void)finish(); }

bool MetricsAggregator::submit(harness::TaskOutcome outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_) {
    return false;
  }
  mailbox_.push_back(Submit{.outcome = std::move(outcome)});
  cv_.notify_one();
  return true;
}

Scorecard MetricsAggregator::snapshot() {
  auto reply = std::make_shared<std::promise<Scorecard>>();
  auto answer = reply->get_future();
  bool stopped = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped = stopped_;
    if (!stopped) {
      mailbox_.push_back(Query{.reply = reply});
      cv_.notify_one();
    }
  }
  if (stopped) {
    return finish();
  }
  return answer.get();
}

Scorecard MetricsAggregator::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stopped_) {
      stopped_ = true;
      mailbox_.push_back(Stop{});
      cv_.notify_one();
    }
  }
  std::lock_guard<std::mutex> join_lock(join_mutex_);
  if (worker_.joinable()) {
    worker_.join();
  }
  return scorecard_;
}

void MetricsAggregator::worker_loop() {
  while (true) {
    Message message;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !mailbox_.empty(); });
      message = std::move(mailbox_.front());
      mailbox_.pop_front();
    }

    if (auto *submit = std::get_if<Submit>(&message)) {
      fold_outcome(scorecard_, submit->outcome);
    } else if (auto *query = std::get_if<Query>(&message)) {
      Scorecard copy = scorecard_;
      copy.sort_rows();
      query->reply->set_value(std::move(copy));
    } else {
      scorecard_.sort_rows();
      return;
    }
  }
}

} // namespace sweguard::metrics
