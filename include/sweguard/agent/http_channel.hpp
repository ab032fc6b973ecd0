#pragma once

#include "sweguard/agent/channel.hpp"
#include "sweguard/agent/http_client.hpp"
#include "sweguard/config/schema.hpp"

#include <memory>
#include <string>

namespace sweguard::agent {

/// `<instance_id>#<attempt>`.
[[nodiscard]] std::string make_session_id(const std::string &instance_id, std::uint32_t attempt);

/// `{endpoint}/turn` with any trailing slash on the endpoint dropped.
[[nodiscard]] std::string turn_url(const std::string &endpoint);

/// Talks to an agent service that answers `POST {endpoint}/turn` with the next action.
class HttpAgentChannel final : public IAgentChannel {
public:
  HttpAgentChannel(config::AgentConfig config, std::shared_ptr<HttpClient> client,
                   std::string session_id);

  [[nodiscard]] common::Result<InboundMessage>
  begin(const SessionStart &start, const common::Deadline &deadline,
        const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Result<InboundMessage>
  exchange(const TurnOutput &output, const common::Deadline &deadline,
           const common::CancellationToken &cancel) override;
  void end(const AttemptReport &report) override;

  [[nodiscard]] const std::string &session_id() const { return session_id_; }

private:
  [[nodiscard]] common::Result<InboundMessage> post_turn(const std::string &body,
                                                         const common::Deadline &deadline,
                                                         const common::CancellationToken &cancel);

  config::AgentConfig config_;
  std::shared_ptr<HttpClient> client_;
  std::string session_id_;
};

class HttpAgentChannelFactory final : public IAgentChannelFactory {
public:
  HttpAgentChannelFactory(config::AgentConfig config, std::shared_ptr<HttpClient> client);

  [[nodiscard]] std::unique_ptr<IAgentChannel> create(const std::string &instance_id,
                                                      std::uint32_t attempt) override;
  [[nodiscard]] std::string_view name() const override { return "http"; }

private:
  config::AgentConfig config_;
  std::shared_ptr<HttpClient> client_;
};

} // namespace sweguard::agent
