#pragma once

#include "sweguard/agent/channel.hpp"
#include "sweguard/common/cancellation.hpp"
#include "sweguard/config/schema.hpp"
#include "sweguard/harness/task_controller.hpp"
#include "sweguard/metrics/aggregator.hpp"
#include "sweguard/sandbox/manager.hpp"
#include "sweguard/security/policy.hpp"
#include "sweguard/store/results_store.hpp"
#include "sweguard/validator/validator.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace sweguard::harness {

struct RunStats {
  std::size_t scheduled = 0;
  std::size_t completed = 0;
  std::size_t skipped = 0;
};

/// Runs tasks on a bounded pool of worker threads. Each finished task goes to the aggregator
/// and, when one is attached, the results store.
class RunCoordinator {
public:
  RunCoordinator(config::Config config, std::shared_ptr<sandbox::SandboxManager> manager,
                 std::shared_ptr<agent::IAgentChannelFactory> channels,
                 metrics::MetricsAggregator &aggregator, store::ResultsStore *store = nullptr);

  /// Returns once every task has finished or the run was cancelled. Tasks not yet started
  /// when cancellation arrives are counted as skipped.
  RunStats run(const std::vector<task::Task> &tasks, const common::CancellationToken &cancel);

private:
  void complete(TaskOutcome outcome);

  config::Config config_;
  std::shared_ptr<sandbox::SandboxManager> manager_;
  std::shared_ptr<agent::IAgentChannelFactory> channels_;
  metrics::MetricsAggregator &aggregator_;
  store::ResultsStore *store_;
  security::SecurityPolicy policy_;
  validator::PatchValidator validator_;
};

} // namespace sweguard::harness
