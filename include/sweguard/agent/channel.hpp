#pragma once

#include "sweguard/agent/protocol.hpp"
#include "sweguard/common/cancellation.hpp"
#include "sweguard/common/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sweguard::agent {

/// Conversation with the agent for one attempt. Implementations are used by one thread at a
/// time; `create` hands each attempt its own channel.
class IAgentChannel {
public:
  virtual ~IAgentChannel() = default;

  [[nodiscard]] virtual common::Result<InboundMessage>
  begin(const SessionStart &start, const common::Deadline &deadline,
        const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual common::Result<InboundMessage>
  exchange(const TurnOutput &output, const common::Deadline &deadline,
           const common::CancellationToken &cancel) = 0;
  /// Best effort; failures are logged by the implementation.
  virtual void end(const AttemptReport &report) = 0;
};

class IAgentChannelFactory {
public:
  virtual ~IAgentChannelFactory() = default;

  [[nodiscard]] virtual std::unique_ptr<IAgentChannel> create(const std::string &instance_id,
                                                              std::uint32_t attempt) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sweguard::agent
