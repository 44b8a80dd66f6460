#include "almanac/agent/session.hpp"

#include "almanac/agent/prompt.hpp"
#include "almanac/agent/stream_assembler.hpp"
#include "almanac/common/json_util.hpp"
#include "almanac/observability/global.hpp"

#include <algorithm>

namespace almanac::agent {

namespace {

std::string tool_error_content(const std::string &tool, const std::string &error) {
  return "{\"tool\":\"" + common::json_escape(tool) + "\",\"success\":false,\"error\":\"" +
         common::json_escape(error) + "\"}";
}

// Generated call ids restart every round; the wire conversation needs them distinct.
std::string unique_call_id(const std::vector<Turn> &history, const std::string &id) {
  std::string candidate = id;
  for (int suffix = 2;; ++suffix) {
    const bool taken = std::any_of(history.begin(), history.end(), [&candidate](const Turn &turn) {
      return turn.role == "tool" && turn.tool_call_id == candidate;
    });
    if (!taken) {
      return candidate;
    }
    candidate = id + "_" + std::to_string(suffix);
  }
}

} // namespace

AgentSession::AgentSession(std::string id, std::shared_ptr<providers::Provider> provider,
                           std::shared_ptr<tools::ToolRegistry> tools, SessionOptions options)
    : id_(std::move(id)), provider_(std::move(provider)), tools_(std::move(tools)),
      options_(std::move(options)), created_at_(std::chrono::system_clock::now()) {
  if (options_.prompt_template.empty()) {
    options_.prompt_template = default_prompt_template();
  }
}

std::vector<providers::ChatMessage>
AgentSession::to_chat_messages(const std::vector<Turn> &history) {
  std::vector<providers::ChatMessage> messages;
  messages.reserve(history.size());
  for (std::size_t i = 0; i < history.size(); ++i) {
    const Turn &turn = history[i];
    if (turn.role != "tool") {
      messages.push_back({.role = turn.role, .content = turn.content});
      continue;
    }

    // Each batch of tool turns becomes one assistant call message followed by the results.
    providers::ChatMessage call_message{.role = "assistant", .content = turn.call_text};
    std::size_t end = i;
    for (; end < history.size() && history[end].role == "tool" &&
           history[end].call_batch == turn.call_batch;
         ++end) {
      call_message.tool_calls.push_back({.id = history[end].tool_call_id,
                                         .name = history[end].tool_name,
                                         .arguments = history[end].tool_arguments});
    }
    messages.push_back(std::move(call_message));
    for (std::size_t j = i; j < end; ++j) {
      messages.push_back({.role = "tool",
                          .content = history[j].content,
                          .tool_call_id = history[j].tool_call_id});
    }
    i = end - 1;
  }
  return messages;
}

providers::CompletionRequest AgentSession::build_request() const {
  providers::CompletionRequest request;
  request.model = options_.model;
  request.temperature = options_.temperature;
  request.system_prompt = render_system_prompt(options_.prompt_template, options_.model,
                                               std::chrono::system_clock::now());
  request.messages = to_chat_messages(history_);
  if (tools_) {
    request.tools = tools_->all_specs();
  }
  return request;
}

common::Result<Reply> AgentSession::process(const std::string &user_text) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto started = std::chrono::steady_clock::now();
  history_.push_back({.role = "user", .content = user_text});

  Reply reply;
  std::size_t tool_turns = 0;
  auto finish = [&](common::Result<Reply> result) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    observability::record_message_processed(id_, elapsed, tool_turns, result.ok());
    if (!result.ok()) {
      observability::record_error("agent", "session " + id_ + ": " +
                                               std::string(common::error_kind_name(result.kind())) +
                                               ": " + result.error());
    }
    return result;
  };

  if (!provider_) {
    return finish(common::Result<Reply>::failure(common::ErrorKind::Provider,
                                                 "no completion provider configured"));
  }

  std::uint32_t invocations = 0;
  while (true) {
    StreamAssembler assembler;
    auto streamed = provider_->stream_completion(
        build_request(), [&assembler](const providers::CompletionChunk &chunk) {
          assembler.feed(chunk);
        });
    if (!streamed.ok()) {
      return finish(common::Result<Reply>::failure(streamed));
    }

    const auto selected = select_reply(assembler.messages());
    if (!selected.has_value()) {
      return finish(common::Result<Reply>::failure(
          common::ErrorKind::NoAssistantReply, "completion contained no assistant message"));
    }

    if (!selected->reasoning.empty()) {
      reply.thoughts.push_back(selected->reasoning);
    }

    if (selected->tool_calls.empty()) {
      history_.push_back({.role = "assistant", .content = selected->content});
      reply.content = selected->content;
      return finish(common::Result<Reply>::success(std::move(reply)));
    }

    const std::uint64_t batch = history_.size();
    bool first_in_batch = true;
    for (const auto &call : selected->tool_calls) {
      if (invocations >= options_.max_tool_iterations) {
        return finish(common::Result<Reply>::failure(
            common::ErrorKind::ToolLoopExceeded,
            "exceeded " + std::to_string(options_.max_tool_iterations) + " tool invocations"));
      }
      ++invocations;

      Turn turn{.role = "tool",
                .tool_name = call.name,
                .tool_call_id = unique_call_id(history_, call.id),
                .tool_arguments = call.arguments,
                .call_batch = batch,
                .call_text = first_in_batch ? selected->content : std::string()};
      first_in_batch = false;
      if (!tools_) {
        turn.content = tool_error_content(call.name, "no tools available");
        history_.push_back(std::move(turn));
        ++tool_turns;
        return finish(common::Result<Reply>::failure(common::ErrorKind::UnknownTool,
                                                     "unknown tool: " + call.name));
      }

      auto result = tools_->invoke_json(call.name, call.arguments, {.session_id = id_});
      if (!result.ok()) {
        turn.content = tool_error_content(call.name, result.error());
        history_.push_back(std::move(turn));
        ++tool_turns;
        return finish(common::Result<Reply>::failure(result.status()));
      }

      turn.content = result.value().output;
      reply.tool_calls.push_back({.id = turn.tool_call_id,
                                  .name = call.name,
                                  .arguments = call.arguments,
                                  .result = result.value().output,
                                  .is_error = !result.value().success});
      history_.push_back(std::move(turn));
      ++tool_turns;

      const auto &metadata = result.value().metadata;
      const auto terminal = metadata.find(std::string(tools::kTerminalKey));
      if (terminal != metadata.end() && terminal->second == "true") {
        const auto text = metadata.find(std::string(tools::kReplyKey));
        reply.content = text == metadata.end() ? result.value().output : text->second;
        history_.push_back({.role = "assistant", .content = reply.content});
        return finish(common::Result<Reply>::success(std::move(reply)));
      }
    }
  }
}

std::vector<Turn> AgentSession::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_;
}

std::size_t AgentSession::history_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_.size();
}

void AgentSession::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  history_.clear();
}

} // namespace almanac::agent
