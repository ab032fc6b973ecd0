#include "sweguard/agent/http_channel.hpp"

#include "sweguard/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace sweguard::agent {

namespace {

constexpr std::chrono::milliseconds END_NOTIFY_TIMEOUT{10'000};
constexpr std::chrono::milliseconds BACKOFF_SLICE{50};

/// Sleeps for `delay` or until cancelled or out of time. False when the wait was cut short.
bool wait_backoff(const std::chrono::milliseconds delay, const common::Deadline &deadline,
                  const common::CancellationToken &cancel) {
  const auto until = std::chrono::steady_clock::now() + delay;
  while (std::chrono::steady_clock::now() < until) {
    if (cancel.is_cancelled() || deadline.expired()) {
      return false;
    }
    std::this_thread::sleep_for(BACKOFF_SLICE);
  }
  return !deadline.expired();
}

} // namespace

std::string make_session_id(const std::string &instance_id, const std::uint32_t attempt) {
  return instance_id + "#" + std::to_string(attempt);
}

std::string turn_url(const std::string &endpoint) {
  std::string base = endpoint;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/turn";
}

HttpAgentChannel::HttpAgentChannel(config::AgentConfig config, std::shared_ptr<HttpClient> client,
                                   std::string session_id)
    : config_(std::move(config)), client_(std::move(client)), session_id_(std::move(session_id)) {}

common::Result<InboundMessage> HttpAgentChannel::begin(const SessionStart &start,
                                                       const common::Deadline &deadline,
                                                       const common::CancellationToken &cancel) {
  return post_turn(encode_session_start(session_id_, start), deadline, cancel);
}

common::Result<InboundMessage> HttpAgentChannel::exchange(const TurnOutput &output,
                                                          const common::Deadline &deadline,
                                                          const common::CancellationToken &cancel) {
  return post_turn(encode_turn_output(session_id_, output), deadline, cancel);
}

void HttpAgentChannel::end(const AttemptReport &report) {
  const auto timeout =
      std::min<std::chrono::milliseconds>(std::chrono::seconds(config_.request_timeout_secs),
                                          END_NOTIFY_TIMEOUT);
  const auto response =
      client_->post_json(turn_url(config_.endpoint), {}, encode_attempt_report(session_id_, report),
                         static_cast<std::uint64_t>(timeout.count()));
  if (response.network_error) {
    observability::record_warning("agent", session_id_ + ": end notification failed: " +
                                               response.network_error_message);
  } else if (response.status < 200 || response.status >= 300) {
    observability::record_warning("agent", session_id_ + ": end notification returned HTTP " +
                                               std::to_string(response.status));
  }
}

common::Result<InboundMessage> HttpAgentChannel::post_turn(const std::string &body,
                                                           const common::Deadline &deadline,
                                                           const common::CancellationToken &cancel) {
  const std::string url = turn_url(config_.endpoint);
  const auto request_timeout = std::chrono::seconds(config_.request_timeout_secs);
  std::string last_error = "agent unreachable";

  for (std::uint32_t attempt = 0; attempt <= config_.retries; ++attempt) {
    if (cancel.is_cancelled()) {
      return common::Result<InboundMessage>::failure("cancelled");
    }
    const auto budget = deadline.clamp(request_timeout);
    if (deadline.expired() || budget.count() <= 0) {
      return common::Result<InboundMessage>::failure("deadline exceeded waiting for agent");
    }

    const auto response =
        client_->post_json(url, {}, body, static_cast<std::uint64_t>(budget.count()));
    if (response.network_error) {
      last_error = response.timeout ? "agent request timed out"
                                    : "agent request failed: " + response.network_error_message;
    } else if (response.status >= 200 && response.status < 300) {
      return decode_inbound(response.body);
    } else if (response.status >= 400 && response.status < 500) {
      return common::Result<InboundMessage>::failure("agent rejected turn with HTTP " +
                                                     std::to_string(response.status) + ": " +
                                                     response.body);
    } else {
      last_error = "agent returned HTTP " + std::to_string(response.status);
    }

    if (attempt < config_.retries) {
      observability::record_warning("agent", session_id_ + ": " + last_error + ", retrying");
      const auto delay = std::chrono::milliseconds(config_.backoff_ms * (1ULL << attempt));
      if (!wait_backoff(delay, deadline, cancel)) {
        break;
      }
    }
  }
  if (cancel.is_cancelled()) {
    return common::Result<InboundMessage>::failure("cancelled");
  }
  return common::Result<InboundMessage>::failure(last_error);
}

HttpAgentChannelFactory::HttpAgentChannelFactory(config::AgentConfig config,
                                                 std::shared_ptr<HttpClient> client)
    : config_(std::move(config)), client_(std::move(client)) {}

std::unique_ptr<IAgentChannel> HttpAgentChannelFactory::create(const std::string &instance_id,
                                                               const std::uint32_t attempt) {
  return std::make_unique<HttpAgentChannel>(config_, client_,
                                            make_session_id(instance_id, attempt));
}

} // namespace sweguard::agent
