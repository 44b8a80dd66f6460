#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "almanac/agent/prompt.hpp"
#include "almanac/agent/session.hpp"
#include "almanac/agent/stream_assembler.hpp"
#include "almanac/tools/builtin/ask_user_question.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace {

namespace a = almanac::agent;
namespace t = almanac::tools;
using almanac::testing::ScriptedProvider;
using almanac::testing::text_completion;
using almanac::testing::tool_call_completion;

std::shared_ptr<t::ToolRegistry> noop_tools(std::shared_ptr<std::atomic<int>> counter) {
  auto registry = std::make_shared<t::ToolRegistry>();
  auto status = registry->register_function(
      "noop", "does nothing", {},
      [counter](const t::ToolArgs &, const t::ToolContext &) {
        counter->fetch_add(1);
        t::ToolResult result;
        result.output = R"({"tool":"noop","success":true})";
        return almanac::common::Result<t::ToolResult>::success(std::move(result));
      });
  almanac::tests::require(status.ok(), status.error());
  return registry;
}

} // namespace

void register_agent_tests(std::vector<almanac::tests::TestCase> &tests) {
  using almanac::tests::require;
  using almanac::common::ErrorKind;

  tests.push_back({"agent_prompt_substitutes_placeholders", [] {
                     const auto rendered = a::render_system_prompt(
                         "model={{MODEL_NAME}} now={{CURRENT_TIME}} again={{MODEL_NAME}}", "m1",
                         std::chrono::system_clock::now());
                     require(rendered.find("model=m1") != std::string::npos, "model missing");
                     require(rendered.find("again=m1") != std::string::npos, "second model missing");
                     require(rendered.find("{{") == std::string::npos, "placeholder left over");

                     almanac::testing::TempWorkspace ws;
                     const auto blank = ws.create_file("blank.md", "  \n");
                     require(a::load_prompt_template(blank) == a::default_prompt_template(),
                             "blank file should fall back");
                     require(a::load_prompt_template(ws.path() / "missing.md") ==
                                 a::default_prompt_template(),
                             "missing file should fall back");
                     const auto custom = ws.create_file("custom.md", "Hi {{MODEL_NAME}}");
                     require(a::load_prompt_template(custom) == "Hi {{MODEL_NAME}}",
                             "custom template ignored");
                   }});

  tests.push_back({"agent_stream_assembler_joins_fragments", [] {
                     a::StreamAssembler assembler;
                     assembler.feed({.entry = 0, .role = "assistant", .content = "Hel"});
                     assembler.feed({.entry = 1, .role = "assistant", .content = "Other"});
                     assembler.feed({.entry = 0, .content = "lo"});
                     assembler.feed({.entry = 0,
                                     .tool_call = almanac::providers::ToolCallFragment{
                                         .index = 0, .name = "noop", .arguments = "{\"a\""}});
                     assembler.feed({.entry = 0,
                                     .tool_call = almanac::providers::ToolCallFragment{
                                         .index = 0, .arguments = ":1}"}});
                     const auto messages = assembler.messages();
                     require(assembler.chunk_count() == 5, "chunk count mismatch");
                     require(messages.size() == 2, "expected two entries");
                     require(messages[0].content == "Hello", "content not joined");
                     require(messages[0].tool_calls.size() == 1, "tool call missing");
                     require(messages[0].tool_calls[0].arguments == "{\"a\":1}",
                             "arguments not joined");
                     require(!messages[0].tool_calls[0].id.empty(), "id should be generated");

                     const auto reply = a::select_reply(messages);
                     require(reply.has_value() && reply->content == "Other",
                             "last assistant entry should win");
                     require(!a::select_reply({{.role = "user", .content = "x"}}).has_value(),
                             "no assistant entry means no reply");
                   }});

  tests.push_back({"agent_plain_reply_appends_two_turns", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     provider->push(text_completion("Hello there"));
                     auto counter = std::make_shared<std::atomic<int>>(0);
                     a::AgentSession session("s1", provider, noop_tools(counter),
                                             {.model = "test-model"});
                     auto reply = session.process("hi");
                     require(reply.ok(), reply.error());
                     require(reply.value().content == "Hello there", "reply mismatch");
                     require(reply.value().tool_calls.empty(), "no tools expected");

                     const auto history = session.history();
                     require(history.size() == 2, "expected user and assistant turns");
                     require(history[0].role == "user" && history[0].content == "hi", "user turn");
                     require(history[1].role == "assistant", "assistant turn");

                     const auto request = provider->requests().front();
                     require(request.model == "test-model", "model not passed");
                     require(request.system_prompt.has_value() &&
                                 request.system_prompt->find("test-model") != std::string::npos,
                             "system prompt should name the model");
                     require(request.tools.size() == 1 && request.tools[0].name == "noop",
                             "tool specs not advertised");
                   }});

  tests.push_back({"agent_tool_round_then_reply", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     provider->push(tool_call_completion("noop", R"({"x":1})", "c1"));
                     provider->push(text_completion("All done"));
                     auto counter = std::make_shared<std::atomic<int>>(0);
                     a::AgentSession session("s1", provider, noop_tools(counter));
                     auto reply = session.process("do it");
                     require(reply.ok(), reply.error());
                     require(reply.value().content == "All done", "reply mismatch");
                     require(reply.value().tool_calls.size() == 1, "tool call not reported");
                     const auto &call = reply.value().tool_calls.front();
                     require(call.id == "c1" && call.name == "noop", "call identity");
                     require(call.arguments == R"({"x":1})", "call arguments");
                     require(call.result == R"({"tool":"noop","success":true})", "call result");
                     require(!call.is_error && call.status() == "completed", "call status");
                     require(counter->load() == 1, "tool should run once");

                     const auto history = session.history();
                     require(history.size() == 3, "user + tool + assistant expected");
                     require(history[1].role == "tool" && history[1].tool_call_id == "c1",
                             "tool turn mismatch");
                     require(history[1].tool_arguments == R"({"x":1})", "arguments not kept");

                     const auto second = provider->requests().at(1).messages;
                     require(second.size() == 3, "expected user, call and result messages");
                     require(second[1].role == "assistant" && second[1].tool_calls.size() == 1,
                             "call message missing");
                     require(second[2].role == "tool" && second[2].tool_call_id == "c1",
                             "result message missing");
                   }});

  tests.push_back({"agent_tool_loop_is_bounded", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     provider->set_repeat(tool_call_completion("noop", "{}"));
                     auto counter = std::make_shared<std::atomic<int>>(0);
                     a::AgentSession session("loop", provider, noop_tools(counter),
                                             {.max_tool_iterations = 3});
                     auto reply = session.process("spin");
                     require(!reply.ok(), "loop should fail");
                     require(reply.kind() == ErrorKind::ToolLoopExceeded, "kind mismatch");
                     require(counter->load() == 3, "exactly three invocations expected");
                     require(provider->calls() == 4, "fourth completion trips the limit");
                     require(session.history_size() == 4, "user + three tool turns kept");

                     const auto messages = a::AgentSession::to_chat_messages(session.history());
                     require(messages.size() == 7, "user, then a call and result per round");
                     for (std::size_t i = 1; i < messages.size(); i += 2) {
                       require(messages[i].role == "assistant" &&
                                   messages[i].tool_calls.size() == 1,
                               "each round keeps its own call message");
                       require(messages[i + 1].role == "tool", "result follows its call");
                     }
                     require(messages[2].tool_call_id != messages[4].tool_call_id,
                             "call ids must be distinct");
                   }});

  tests.push_back({"agent_keeps_text_sent_with_tool_calls", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     auto first = tool_call_completion("noop", "{}", "c1");
                     first.chunks.push_back({.entry = 0, .content = "Let me check."});
                     first.chunks.push_back({.entry = 0,
                                             .tool_call = almanac::providers::ToolCallFragment{
                                                 .index = 1, .id = "c1b", .name = "noop",
                                                 .arguments = "{}"}});
                     provider->push(first);
                     provider->push(tool_call_completion("noop", "{}", "c2"));
                     provider->push(text_completion("Done"));
                     auto counter = std::make_shared<std::atomic<int>>(0);
                     a::AgentSession session("s", provider, noop_tools(counter));
                     require(session.process("go").ok(), "process failed");

                     const auto messages = a::AgentSession::to_chat_messages(session.history());
                     // user, call(2), result, result, call(1), result, assistant
                     require(messages.size() == 7, "unexpected message count");
                     require(messages[1].content == "Let me check.", "call text lost");
                     require(messages[1].tool_calls.size() == 2, "first round has two calls");
                     require(messages[4].role == "assistant" && messages[4].content.empty() &&
                                 messages[4].tool_calls.size() == 1,
                             "second round must not merge into the first");
                     require(messages[6].content == "Done", "final reply");
                   }});

  tests.push_back({"agent_collects_reasoning_as_thoughts", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     auto call = tool_call_completion("noop", "{}", "c1");
                     call.chunks.push_back({.entry = 0, .reasoning = "need to look first"});
                     auto answer = text_completion("Nothing today");
                     answer.chunks.push_back({.entry = 0, .reasoning = "list was empty"});
                     provider->push(call);
                     provider->push(answer);
                     auto counter = std::make_shared<std::atomic<int>>(0);
                     a::AgentSession session("s", provider, noop_tools(counter));
                     auto reply = session.process("anything today?");
                     require(reply.ok(), reply.error());
                     require(reply.value().thoughts ==
                                 std::vector<std::string>{"need to look first", "list was empty"},
                             "thoughts mismatch");
                   }});

  tests.push_back({"agent_streamed_reply_without_role_is_assistant", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     almanac::testing::ScriptedCompletion unnamed;
                     unnamed.chunks.push_back({.entry = 0, .content = "Sure", .streamed = true});
                     unnamed.chunks.push_back({.entry = 0, .content = " thing", .streamed = true});
                     provider->push(unnamed);
                     a::AgentSession session("s", provider, nullptr);
                     auto reply = session.process("hi");
                     require(reply.ok(), reply.error());
                     require(reply.value().content == "Sure thing", "content mismatch");
                   }});

  tests.push_back({"agent_missing_assistant_entry_fails", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     almanac::testing::ScriptedCompletion odd;
                     odd.chunks.push_back({.entry = 0, .role = "tool", .content = "stray"});
                     provider->push(odd);
                     provider->push(almanac::testing::ScriptedCompletion{});
                     a::AgentSession session("s", provider, nullptr);

                     auto first = session.process("one");
                     require(first.kind() == ErrorKind::NoAssistantReply, "stray role");
                     auto second = session.process("two");
                     require(second.kind() == ErrorKind::NoAssistantReply, "empty completion");
                     require(session.history_size() == 2, "user turns should stay");
                   }});

  tests.push_back({"agent_provider_failure_keeps_user_turn", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     provider->push({.error = almanac::common::Status::error(ErrorKind::Provider,
                                                                            "offline")});
                     a::AgentSession session("s", provider, nullptr);
                     auto reply = session.process("hello");
                     require(reply.kind() == ErrorKind::Provider, "kind mismatch");
                     require(session.history_size() == 1, "user turn should stay");

                     a::AgentSession unconfigured("s2", nullptr, nullptr);
                     require(unconfigured.process("x").kind() == ErrorKind::Provider,
                             "null provider should be a provider error");
                   }});

  tests.push_back({"agent_unknown_tool_fails_and_keeps_history", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     provider->push(tool_call_completion("teleport", "{}", "c9"));
                     auto counter = std::make_shared<std::atomic<int>>(0);
                     a::AgentSession session("s", provider, noop_tools(counter));
                     auto reply = session.process("beam me up");
                     require(reply.kind() == ErrorKind::UnknownTool, "kind mismatch");
                     const auto history = session.history();
                     require(history.size() == 2, "user and error tool turn expected");
                     require(history[1].role == "tool" &&
                                 history[1].content.find("\"success\":false") != std::string::npos,
                             "error turn missing");
                   }});

  tests.push_back({"agent_ask_user_question_ends_turn", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     provider->push(tool_call_completion(
                         "askUserQuestion",
                         R"({"question":"Which meeting?","options":["Standup","Review"]})"));
                     auto registry = std::make_shared<t::ToolRegistry>();
                     require(registry->register_tool(std::make_unique<t::AskUserQuestionTool>())
                                 .ok(),
                             "registration failed");
                     a::AgentSession session("s", provider, registry);
                     auto reply = session.process("move my meeting");
                     require(reply.ok(), reply.error());
                     require(provider->calls() == 1, "no second completion expected");
                     require(reply.value().content.find("A. Standup") != std::string::npos,
                             "markdown should be the reply");
                     const auto history = session.history();
                     require(history.size() == 3, "user, tool and assistant turns expected");
                     require(history.back().role == "assistant" &&
                                 history.back().content == reply.value().content,
                             "assistant turn should hold the question");
                   }});

  tests.push_back({"agent_clear_resets_history", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     provider->set_repeat(text_completion("ok"));
                     a::AgentSession session("s", provider, nullptr);
                     require(session.process("a").ok(), "first message");
                     require(session.process("b").ok(), "second message");
                     require(session.history_size() == 4, "two exchanges expected");
                     session.clear();
                     require(session.history_size() == 0, "history should be empty");
                     require(session.id() == "s", "id must survive clear");
                   }});

  tests.push_back({"agent_concurrent_messages_are_serialized", [] {
                     auto provider = std::make_shared<almanac::testing::DelayedProvider>(
                         std::chrono::milliseconds(20));
                     auto session = std::make_shared<a::AgentSession>("shared", provider, nullptr);
                     std::atomic<int> failures{0};
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 4; ++i) {
                       threads.emplace_back([session, &failures, i] {
                         if (!session->process("m" + std::to_string(i)).ok()) {
                           failures.fetch_add(1);
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(failures.load() == 0, "processing failed");
                     require(provider->max_in_flight() == 1, "completions overlapped");

                     const auto history = session->history();
                     require(history.size() == 8, "expected four exchanges");
                     for (std::size_t i = 0; i < history.size(); i += 2) {
                       require(history[i].role == "user", "user turn expected");
                       require(history[i + 1].role == "assistant", "assistant turn expected");
                       require(history[i + 1].content == "echo: " + history[i].content,
                               "reply belongs to another message");
                     }
                   }});
}
