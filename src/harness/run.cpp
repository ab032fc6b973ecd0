#include "sweguard/harness/run.hpp"

#include "sweguard/observability/global.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace sweguard::harness {

RunCoordinator::RunCoordinator(config::Config config,
                               std::shared_ptr<sandbox::SandboxManager> manager,
                               std::shared_ptr<agent::IAgentChannelFactory> channels,
                               metrics::MetricsAggregator &aggregator, store::ResultsStore *store)
    : config_(std::move(config)), manager_(std::move(manager)), channels_(std::move(channels)),
      aggregator_(aggregator), store_(store), policy_(config_.policy),
      validator_(*manager_, config_.validator) {}

void RunCoordinator::complete(TaskOutcome outcome) {
  if (store_ != nullptr) {
    if (auto status = store_->record(outcome); !status.ok()) {
      observability::record_error("store", outcome.instance_id + ": " + status.error());
    }
  }
  if (!aggregator_.submit(std::move(outcome))) {
    observability::record_warning("metrics", "outcome submitted after the run finished");
  }
}

RunStats RunCoordinator::run(const std::vector<task::Task> &tasks,
                             const common::CancellationToken &cancel) {
  RunStats stats;
  stats.scheduled = tasks.size();
  if (tasks.empty()) {
    return stats;
  }

  std::atomic<std::size_t> next{0};
  std::atomic<std::size_t> completed{0};
  auto worker = [&]() {
    TaskController controller(config_.run, *manager_, policy_, validator_, *channels_);
    while (!cancel.is_cancelled()) {
      const std::size_t index = next.fetch_add(1);
      if (index >= tasks.size()) {
        return;
      }
      complete(controller.run(tasks[index], cancel));
      completed.fetch_add(1);
    }
  };

  const std::size_t workers =
      std::min<std::size_t>(std::max<std::uint32_t>(config_.run.concurrency, 1), tasks.size());
  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    pool.emplace_back(worker);
  }
  for (auto &thread : pool) {
    thread.join();
  }

  stats.completed = completed.load();
  stats.skipped = stats.scheduled - stats.completed;
  return stats;
}

} // namespace sweguard::harness
