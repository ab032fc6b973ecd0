#include "test_framework.hpp"

#include "sweguard/agent/action.hpp"
#include "sweguard/agent/http_channel.hpp"
#include "sweguard/common/json_util.hpp"

#include <deque>
#include <memory>

namespace {

namespace ag = sweguard::agent;
using sweguard::common::CancellationToken;
using sweguard::common::Deadline;

class MockHttpClient final : public ag::HttpClient {
public:
  std::deque<ag::HttpResponse> responses;
  std::vector<std::string> urls;
  std::vector<std::string> bodies;
  std::vector<std::uint64_t> timeouts;

  ag::HttpResponse post_json(const std::string &url,
                             const std::unordered_map<std::string, std::string> &,
                             const std::string &body, const std::uint64_t timeout_ms) override {
    urls.push_back(url);
    bodies.push_back(body);
    timeouts.push_back(timeout_ms);
    if (responses.empty()) {
      ag::HttpResponse failed;
      failed.network_error = true;
      failed.network_error_message = "connection refused";
      return failed;
    }
    auto next = responses.front();
    responses.pop_front();
    return next;
  }
};

ag::HttpResponse ok_response(const std::string &body) {
  ag::HttpResponse response;
  response.status = 200;
  response.body = body;
  return response;
}

ag::HttpResponse status_response(const std::uint16_t status, const std::string &body = "") {
  ag::HttpResponse response;
  response.status = status;
  response.body = body;
  return response;
}

ag::HttpResponse network_failure(const bool timeout = false) {
  ag::HttpResponse response;
  response.network_error = true;
  response.timeout = timeout;
  response.network_error_message = timeout ? "timed out" : "connection reset";
  return response;
}

sweguard::config::AgentConfig agent_config() {
  sweguard::config::AgentConfig config;
  config.endpoint = "http://agent.local:9010/";
  config.request_timeout_secs = 30;
  config.retries = 2;
  config.backoff_ms = 1;
  return config;
}

std::string field(const std::string &json, const std::string &key) {
  const auto parsed = sweguard::common::json_parse_object(json);
  if (!parsed.ok()) {
    return "<invalid json: " + parsed.error() + ">";
  }
  const auto it = parsed.value().find(key);
  return it == parsed.value().end() ? "<missing>" : it->second;
}

} // namespace

void register_agent_tests(std::vector<sweguard::tests::TestCase> &tests) {
  using sweguard::tests::require;

  tests.push_back({"protocol_decodes_reply_with_usage", [] {
                     const auto decoded = ag::decode_inbound(
                         R"({"action":"bash","content":"ls -la","usage":{"total_tokens":42}})");
                     require(decoded.ok(), decoded.error());
                     require(decoded.value().action == "bash", "action");
                     require(decoded.value().content == "ls -la", "content");
                     require(decoded.value().total_tokens == 42u, "reported tokens");
                     require(decoded.value().tokens() == 42, "tokens uses reported usage");
                   }});

  tests.push_back({"protocol_estimates_tokens_without_usage", [] {
                     const auto decoded = ag::decode_inbound(
                         R"({"action":"patch","content":"diff --git a/x b/x\n","usage":null})");
                     require(decoded.ok(), decoded.error());
                     require(!decoded.value().total_tokens.has_value(), "no usage");
                     require(decoded.value().tokens() == ag::estimate_tokens("diff --git a/x b/x\n"),
                             "estimate from content");
                     require(ag::estimate_tokens("") == 0 && ag::estimate_tokens("abcd") == 1 &&
                                 ag::estimate_tokens("abcde") == 2,
                             "ceil(len / 4)");
                   }});

  tests.push_back({"protocol_rejects_malformed_replies", [] {
                     require(!ag::decode_inbound("not json").ok(), "not json");
                     require(!ag::decode_inbound(R"({"action":"bash","usage":"lots"})").ok(),
                             "usage must be an object");
                     require(!ag::decode_inbound(R"({"action":"bash","usage":{"total_tokens":-3}})")
                                  .ok(),
                             "negative token count");
                     const auto missing = ag::decode_inbound(R"({"content":"ls"})");
                     require(missing.ok() && missing.value().action.empty(),
                             "missing action is left to to_action");
                   }});

  tests.push_back({"protocol_encodes_outbound_messages", [] {
                     const ag::SessionStart start{.cwd = "/workspace/repo",
                                                  .problem_statement = "add() is \"wrong\"\n",
                                                  .hints_text = "",
                                                  .runtime_version = "3.9",
                                                  .fail_to_pass = {"tests/test_calc.py::test_add"}};
                     const auto begin = ag::encode_session_start("demo#1", start);
                     require(field(begin, "kind") == "start", "kind");
                     require(field(begin, "session_id") == "demo#1", "session id");
                     require(field(begin, "problem_statement") == "add() is \"wrong\"\n",
                             "escaped text round-trips");
                     require(field(begin, "fail_to_pass") == R"(["tests/test_calc.py::test_add"])",
                             "fail_to_pass list: " + field(begin, "fail_to_pass"));

                     const auto turn = ag::encode_turn_output(
                         "demo#1", ag::TurnOutput{.cwd = "/workspace/repo/tests",
                                                  .stdout_text = "a\tb",
                                                  .stderr_text = ""});
                     require(field(turn, "kind") == "result", "kind");
                     require(field(turn, "stdout") == "a\tb", "stdout");
                     require(field(turn, "cwd") == "/workspace/repo/tests", "cwd");

                     const auto end = ag::encode_attempt_report(
                         "demo#1", ag::AttemptReport{.instance_id = "demo",
                                                     .attempt = 1,
                                                     .outcome = "resolved",
                                                     .turns = 4,
                                                     .tokens = 900});
                     require(field(end, "kind") == "end" && field(end, "turns") == "4" &&
                                 field(end, "tokens") == "900",
                             "report fields");
                   }});

  tests.push_back({"to_action_validates_tags_and_commands", [] {
                     const auto bash = ag::to_action(ag::InboundMessage{
                         .action = " BASH ", .content = "ls", .total_tokens = std::nullopt});
                     require(bash.ok() && std::holds_alternative<ag::BashAction>(bash.value()),
                             "bash tag is case-insensitive");
                     require(ag::action_kind(bash.value()) == "bash", "kind");

                     const auto debug = ag::to_action(ag::InboundMessage{
                         .action = "debug", .content = "python t.py", .total_tokens = 3});
                     require(debug.ok() && std::get<ag::DebugAction>(debug.value()).command ==
                                               "python t.py",
                             "debug command");

                     const auto patch = ag::to_action(ag::InboundMessage{
                         .action = "patch", .content = "", .total_tokens = std::nullopt});
                     require(patch.ok() && std::holds_alternative<ag::PatchAction>(patch.value()),
                             "empty patches are left to the validator");

                     const auto empty = ag::to_action(ag::InboundMessage{
                         .action = "bash", .content = "  ", .total_tokens = std::nullopt});
                     require(!empty.ok() && empty.error().find("empty bash command") !=
                                                std::string::npos,
                             "empty command rejected");
                     const auto unknown = ag::to_action(ag::InboundMessage{
                         .action = "python", .content = "x", .total_tokens = std::nullopt});
                     require(!unknown.ok() &&
                                 unknown.error().find("unknown action 'python'") != std::string::npos,
                             "unknown tag rejected");
                     require(!ag::to_action(ag::InboundMessage{}).ok(), "missing tag rejected");
                   }});

  tests.push_back({"http_channel_urls_and_session_ids", [] {
                     require(ag::make_session_id("django__django-11099", 3) ==
                                 "django__django-11099#3",
                             "session id");
                     require(ag::turn_url("http://a:1//") == "http://a:1/turn", "slashes dropped");
                     require(ag::turn_url("http://a:1") == "http://a:1/turn", "plain endpoint");
                   }});

  tests.push_back({"http_channel_posts_turns_and_decodes_replies", [] {
                     auto client = std::make_shared<MockHttpClient>();
                     client->responses.push_back(ok_response(R"({"action":"bash","content":"ls"})"));
                     client->responses.push_back(
                         ok_response(R"({"action":"patch","content":"","usage":{"total_tokens":7}})"));
                     ag::HttpAgentChannel channel(agent_config(), client, "demo#1");

                     const auto first = channel.begin(ag::SessionStart{.cwd = "/workspace/repo"},
                                                      Deadline::never(), CancellationToken{});
                     require(first.ok() && first.value().content == "ls", "first reply");
                     const auto second = channel.exchange(
                         ag::TurnOutput{.cwd = "/workspace/repo", .stdout_text = "calc.py\n"},
                         Deadline::never(), CancellationToken{});
                     require(second.ok() && second.value().tokens() == 7, "second reply");

                     require(client->urls.size() == 2 &&
                                 client->urls[0] == "http://agent.local:9010/turn",
                             "turn url");
                     require(field(client->bodies[0], "kind") == "start", "start message first");
                     require(field(client->bodies[1], "stdout") == "calc.py\n", "turn output sent");
                     require(client->timeouts[0] == 30'000, "request timeout in ms");
                   }});

  tests.push_back({"http_channel_retries_server_and_network_errors", [] {
                     auto client = std::make_shared<MockHttpClient>();
                     client->responses.push_back(status_response(503));
                     client->responses.push_back(network_failure());
                     client->responses.push_back(ok_response(R"({"action":"bash","content":"pwd"})"));
                     ag::HttpAgentChannel channel(agent_config(), client, "demo#1");
                     const auto reply =
                         channel.begin(ag::SessionStart{}, Deadline::never(), CancellationToken{});
                     require(reply.ok(), reply.error());
                     require(reply.value().content == "pwd", "third try succeeds");
                     require(client->bodies.size() == 3, "two retries");
                   }});

  tests.push_back({"http_channel_gives_up_after_retries", [] {
                     auto client = std::make_shared<MockHttpClient>();
                     client->responses.push_back(status_response(500));
                     client->responses.push_back(status_response(502));
                     client->responses.push_back(network_failure(true));
                     client->responses.push_back(ok_response(R"({"action":"bash","content":"ls"})"));
                     ag::HttpAgentChannel channel(agent_config(), client, "demo#1");
                     const auto reply =
                         channel.begin(ag::SessionStart{}, Deadline::never(), CancellationToken{});
                     require(!reply.ok(), "retries exhausted");
                     require(reply.error() == "agent request timed out", reply.error());
                     require(client->bodies.size() == 3, "one try plus two retries");
                   }});

  tests.push_back({"http_channel_does_not_retry_client_errors", [] {
                     auto client = std::make_shared<MockHttpClient>();
                     client->responses.push_back(status_response(422, "bad session"));
                     ag::HttpAgentChannel channel(agent_config(), client, "demo#1");
                     const auto reply =
                         channel.begin(ag::SessionStart{}, Deadline::never(), CancellationToken{});
                     require(!reply.ok(), "4xx fails");
                     require(reply.error().find("HTTP 422: bad session") != std::string::npos,
                             reply.error());
                     require(client->bodies.size() == 1, "no retry");

                     client->responses.push_back(ok_response("{\"action\":"));
                     const auto malformed = channel.exchange(ag::TurnOutput{}, Deadline::never(),
                                                             CancellationToken{});
                     require(!malformed.ok() &&
                                 malformed.error().find("malformed agent reply") == 0,
                             "malformed body is not retried");
                     require(client->bodies.size() == 2, "still no retry");
                   }});

  tests.push_back({"http_channel_stops_on_cancel_and_deadline", [] {
                     auto client = std::make_shared<MockHttpClient>();
                     ag::HttpAgentChannel channel(agent_config(), client, "demo#1");
                     CancellationToken cancel;
                     cancel.cancel();
                     const auto cancelled = channel.begin(ag::SessionStart{}, Deadline::never(), cancel);
                     require(!cancelled.ok() && cancelled.error() == "cancelled", "cancelled");

                     const auto expired = channel.begin(
                         ag::SessionStart{}, Deadline::after(std::chrono::milliseconds(0)),
                         CancellationToken{});
                     require(!expired.ok() && expired.error().find("deadline") != std::string::npos,
                             expired.error());
                     require(client->bodies.empty(), "nothing was sent");
                   }});

  tests.push_back({"http_channel_end_is_best_effort", [] {
                     auto client = std::make_shared<MockHttpClient>();
                     ag::HttpAgentChannel channel(agent_config(), client, "demo#2");
                     channel.end(ag::AttemptReport{.instance_id = "demo",
                                                   .attempt = 2,
                                                   .outcome = "no_patch",
                                                   .turns = 5,
                                                   .tokens = 10});
                     require(client->bodies.size() == 1, "one notification");
                     require(field(client->bodies[0], "kind") == "end", "end message");
                     require(field(client->bodies[0], "outcome") == "no_patch", "outcome sent");
                     require(client->timeouts[0] == 10'000, "end notification is capped");
                   }});

  tests.push_back({"http_channel_factory_names_sessions", [] {
                     auto client = std::make_shared<MockHttpClient>();
                     client->responses.push_back(ok_response(R"({"action":"bash","content":"ls"})"));
                     ag::HttpAgentChannelFactory factory(agent_config(), client);
                     require(factory.name() == "http", "factory name");
                     auto channel = factory.create("demo", 3);
                     const auto reply =
                         channel->begin(ag::SessionStart{}, Deadline::never(), CancellationToken{});
                     require(reply.ok(), reply.error());
                     require(field(client->bodies[0], "session_id") == "demo#3", "session id");
                   }});
}
