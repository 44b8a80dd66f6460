#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "almanac/agent/stream_assembler.hpp"
#include "almanac/common/json_util.hpp"
#include "almanac/providers/compatible.hpp"
#include "almanac/providers/factory.hpp"
#include "almanac/providers/reliable.hpp"

#include <memory>
#include <mutex>

namespace {

namespace p = almanac::providers;

class FakeHttpClient final : public p::HttpClient {
public:
  explicit FakeHttpClient(p::HttpResponse response, std::vector<std::string> pieces = {})
      : response_(std::move(response)), pieces_(std::move(pieces)) {}

  p::HttpResponse post_json(const std::string &url,
                            const std::unordered_map<std::string, std::string> &headers,
                            const std::string &body, std::uint64_t) override {
    remember(url, headers, body);
    return response_;
  }

  p::HttpResponse post_json_stream(const std::string &url,
                                   const std::unordered_map<std::string, std::string> &headers,
                                   const std::string &body, std::uint64_t,
                                   const p::StreamChunkCallback &on_chunk) override {
    remember(url, headers, body);
    for (const auto &piece : pieces_) {
      on_chunk(piece);
    }
    return response_;
  }

  std::string last_url;
  std::string last_body;
  std::unordered_map<std::string, std::string> last_headers;
  int calls = 0;

private:
  void remember(const std::string &url,
                const std::unordered_map<std::string, std::string> &headers,
                const std::string &body) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls;
    last_url = url;
    last_headers = headers;
    last_body = body;
  }

  std::mutex mutex_;
  p::HttpResponse response_;
  std::vector<std::string> pieces_;
};

p::HttpResponse sse_response() {
  p::HttpResponse response;
  response.status = 200;
  response.headers["content-type"] = "text/event-stream";
  return response;
}

p::CompletionRequest simple_request() {
  p::CompletionRequest request;
  request.model = "test-model";
  request.system_prompt = "be brief";
  request.messages.push_back({.role = "user", .content = "hi"});
  return request;
}

std::vector<almanac::agent::CompletionMessage> collect(p::Provider &provider,
                                                       almanac::common::Status &status) {
  almanac::agent::StreamAssembler assembler;
  status = provider.stream_completion(simple_request(), [&assembler](const p::CompletionChunk &c) {
    assembler.feed(c);
  });
  return assembler.messages();
}

} // namespace

void register_provider_tests(std::vector<almanac::tests::TestCase> &tests) {
  using almanac::tests::require;
  using almanac::common::ErrorKind;

  tests.push_back({"provider_parses_delta_content", [] {
                     auto chunks = p::parse_completion_event(
                         R"({"choices":[{"index":0,"delta":{"role":"assistant","content":"Hel"}}]})");
                     require(chunks.ok(), chunks.error());
                     require(chunks.value().size() == 1, "expected one chunk");
                     require(chunks.value()[0].role == "assistant", "role mismatch");
                     require(chunks.value()[0].content == "Hel", "content mismatch");
                     require(chunks.value()[0].streamed, "delta chunks are streamed");

                     auto thinking = p::parse_completion_event(
                         R"({"choices":[{"index":0,"delta":{"reasoning_content":"hmm"}}]})");
                     require(thinking.ok() && thinking.value().size() == 1, "reasoning chunk");
                     require(thinking.value()[0].reasoning == "hmm", "reasoning_content");
                     require(thinking.value()[0].role.empty(), "no role given");

                     auto alt = p::parse_completion_event(
                         R"({"choices":[{"delta":{"reasoning":"ok","content":"x"}}]})");
                     require(alt.ok() && alt.value()[0].reasoning == "ok", "reasoning field");

                     auto whole = p::parse_completion_event(
                         R"({"choices":[{"message":{"role":"assistant","content":"all"}}]})");
                     require(whole.ok() && !whole.value()[0].streamed, "message is not streamed");
                   }});

  tests.push_back({"provider_parses_tool_call_fragments", [] {
                     auto chunks = p::parse_completion_event(
                         R"({"choices":[{"index":0,"delta":{"tool_calls":[{"index":0,"id":"call_9","type":"function","function":{"name":"list_schedules","arguments":"{\"lim"}}]}}]})");
                     require(chunks.ok(), chunks.error());
                     require(chunks.value().size() == 1, "expected one fragment");
                     const auto &fragment = chunks.value()[0].tool_call;
                     require(fragment.has_value(), "tool call missing");
                     require(fragment->id == "call_9", "id mismatch");
                     require(fragment->name == "list_schedules", "name mismatch");
                     require(fragment->arguments == "{\"lim", "arguments mismatch");
                   }});

  tests.push_back({"provider_error_event_fails", [] {
                     auto chunks = p::parse_completion_event(
                         R"({"error":{"message":"model overloaded","code":503}})");
                     require(!chunks.ok(), "error object should fail");
                     require(chunks.kind() == ErrorKind::Provider, "kind mismatch");
                     require(chunks.error() == "model overloaded", "message mismatch");
                     require(!p::parse_completion_event(R"({"id":"x"})").ok(),
                             "missing choices should fail");
                   }});

  tests.push_back({"provider_body_carries_tools_and_tool_messages", [] {
                     p::CompletionRequest request = simple_request();
                     request.tools.push_back({.name = "list_schedules",
                                              .description = "List",
                                              .parameters_json = R"({"type":"object"})"});
                     request.messages.push_back(
                         {.role = "assistant",
                          .tool_calls = {{.id = "c1", .name = "list_schedules", .arguments = "{}"}}});
                     request.messages.push_back(
                         {.role = "tool", .content = "[]", .tool_call_id = "c1"});

                     const auto body = p::CompatibleProvider::build_body(request, true);
                     require(almanac::common::json_is_valid(body), "body is not JSON: " + body);
                     require(body.find(R"("tool_choice":"auto")") != std::string::npos,
                             "tool_choice missing");
                     require(body.find(R"("content":null,"tool_calls":[{"id":"c1")") !=
                                 std::string::npos,
                             "assistant tool call not rendered");
                     require(body.find(R"("tool_call_id":"c1")") != std::string::npos,
                             "tool result not linked");
                     require(body.find(R"("stream":true)") != std::string::npos, "stream flag");
                     require(body.find(R"({"role":"system","content":"be brief"})") !=
                                 std::string::npos,
                             "system prompt missing");
                   }});

  tests.push_back({"provider_streams_sse_events", [] {
                     auto http = std::make_shared<FakeHttpClient>(
                         sse_response(),
                         std::vector<std::string>{
                             "data: {\"choices\":[{\"index\":0,\"delta\":{\"role\":\"assis",
                             "tant\",\"content\":\"Hello\"}}]}\n\n",
                             "data: {\"choices\":[{\"index\":0,\"delta\":{\"content\":\" there\"}}]}\n\n",
                             "data: [DONE]\n\n"});
                     p::CompatibleProvider provider("compatible", "http://localhost/v1/", "key",
                                                    http);
                     almanac::common::Status status = almanac::common::Status::success();
                     const auto messages = collect(provider, status);
                     require(status.ok(), status.error());
                     require(http->last_url == "http://localhost/v1/chat/completions",
                             "url mismatch: " + http->last_url);
                     require(http->last_headers.at("Authorization") == "Bearer key",
                             "auth header mismatch");
                     require(messages.size() == 1, "expected one message");
                     require(messages[0].content == "Hello there", "content not assembled");
                   }});

  tests.push_back({"provider_accepts_non_streamed_body", [] {
                     p::HttpResponse response;
                     response.status = 200;
                     response.body =
                         R"({"choices":[{"index":0,"message":{"role":"assistant","content":"Done"}}]})";
                     auto http = std::make_shared<FakeHttpClient>(response);
                     p::CompatibleProvider provider("compatible", "http://localhost/v1", "key",
                                                    http);
                     almanac::common::Status status = almanac::common::Status::success();
                     const auto messages = collect(provider, status);
                     require(status.ok(), status.error());
                     require(messages.size() == 1 && messages[0].content == "Done",
                             "body not decoded");
                   }});

  tests.push_back({"provider_auth_failure_is_provider_error", [] {
                     p::HttpResponse response;
                     response.status = 401;
                     response.body = "unauthorized";
                     auto http = std::make_shared<FakeHttpClient>(response);
                     p::CompatibleProvider provider("compatible", "http://localhost/v1", "key",
                                                    http);
                     almanac::common::Status status = almanac::common::Status::success();
                     (void)collect(provider, status);
                     require(!status.ok(), "401 should fail");
                     require(status.kind() == ErrorKind::Provider, "kind mismatch");

                     p::CompatibleProvider keyless("compatible", "http://localhost/v1", "", http);
                     (void)collect(keyless, status);
                     require(!status.ok(), "missing key should fail");
                     require(http->calls == 1, "missing key must not reach the network");
                   }});

  tests.push_back({"provider_reliable_retries_until_success", [] {
                     auto scripted = std::make_shared<almanac::testing::ScriptedProvider>();
                     scripted->push({.error = almanac::common::Status::error(
                                         ErrorKind::Provider, "temporary")});
                     scripted->push(almanac::testing::text_completion("recovered"));
                     p::ReliableProvider reliable(scripted, {}, 2, 1);
                     almanac::common::Status status = almanac::common::Status::success();
                     const auto messages = collect(reliable, status);
                     require(status.ok(), status.error());
                     require(scripted->calls() == 2, "expected one retry");
                     require(messages.size() == 1 && messages[0].content == "recovered",
                             "reply mismatch");
                   }});

  tests.push_back({"provider_reliable_gives_up_after_retries", [] {
                     auto scripted = std::make_shared<almanac::testing::ScriptedProvider>();
                     scripted->set_repeat({.error = almanac::common::Status::error(
                                               ErrorKind::Provider, "down")});
                     p::ReliableProvider reliable(scripted, {}, 2, 1);
                     almanac::common::Status status = almanac::common::Status::success();
                     (void)collect(reliable, status);
                     require(!status.ok(), "should fail");
                     require(scripted->calls() == 3, "expected initial attempt plus two retries");
                   }});

  tests.push_back({"provider_reliable_does_not_retry_after_delivery", [] {
                     auto http = std::make_shared<FakeHttpClient>(
                         sse_response(),
                         std::vector<std::string>{
                             "data: {\"choices\":[{\"index\":0,\"delta\":{\"content\":\"par\"}}]}\n\n",
                             "data: {\"error\":{\"message\":\"cut off\"}}\n\n"});
                     auto compatible = std::make_shared<p::CompatibleProvider>(
                         "compatible", "http://localhost/v1", "key", http);
                     p::ReliableProvider reliable(compatible, {}, 3, 1);
                     almanac::common::Status status = almanac::common::Status::success();
                     (void)collect(reliable, status);
                     require(!status.ok(), "mid-stream error should fail");
                     require(http->calls == 1, "partial stream must not be retried");
                   }});

  tests.push_back({"provider_factory_requires_api_key", [] {
                     auto config = almanac::testing::mock_config();
                     config.provider.api_key.reset();
                     auto provider = p::create_provider(config.provider);
                     require(!provider.ok(), "missing key should fail");
                     require(provider.kind() == ErrorKind::Provider, "kind mismatch");

                     auto configured = p::create_provider(almanac::testing::mock_config().provider);
                     require(configured.ok(), configured.error());
                     require(configured.value()->name() == "reliable", "expected retry wrapper");
                   }});
}
