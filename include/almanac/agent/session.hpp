#pragma once

#include "almanac/common/result.hpp"
#include "almanac/providers/traits.hpp"
#include "almanac/tools/tool_registry.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace almanac::agent {

/// One history entry. A "tool" turn carries both the model's call (name, id, arguments) and
/// the result in `content`. Tool turns answering the same model response share `call_batch`;
/// the first of them keeps any text the model sent along with the calls in `call_text`.
struct Turn {
  std::string role;
  std::string content;
  std::string tool_name;
  std::string tool_call_id;
  std::string tool_arguments;
  std::uint64_t call_batch = 0;
  std::string call_text;
};

struct ToolCallRecord {
  std::string id;
  std::string name;
  std::string arguments;
  std::string result;
  bool is_error = false;

  [[nodiscard]] std::string_view status() const { return is_error ? "error" : "completed"; }
};

struct Reply {
  std::string content;
  std::vector<ToolCallRecord> tool_calls;
  /// Reasoning text streamed by the model, one entry per completion that carried any.
  std::vector<std::string> thoughts;
};

struct SessionOptions {
  std::string model = "moonshotai/kimi-k2.5";
  double temperature = 0.7;
  std::uint32_t max_tool_iterations = 10;
  std::string prompt_template;
};

/// A conversation. process() holds the session lock from the user turn to the reply, so
/// concurrent callers on the same session run one after another.
class AgentSession {
public:
  AgentSession(std::string id, std::shared_ptr<providers::Provider> provider,
               std::shared_ptr<tools::ToolRegistry> tools, SessionOptions options = {});

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] std::chrono::system_clock::time_point created_at() const { return created_at_; }

  /// Fails with Provider, NoAssistantReply, ToolLoopExceeded or the tool registry's error
  /// kinds. Turns appended before a failure stay in the history.
  [[nodiscard]] common::Result<Reply> process(const std::string &user_text);

  [[nodiscard]] std::vector<Turn> history() const;
  [[nodiscard]] std::size_t history_size() const;
  void clear();

  /// Wire conversation for the current history (tool turns expanded into call and result).
  [[nodiscard]] static std::vector<providers::ChatMessage>
  to_chat_messages(const std::vector<Turn> &history);

private:
  [[nodiscard]] providers::CompletionRequest build_request() const;

  std::string id_;
  std::shared_ptr<providers::Provider> provider_;
  std::shared_ptr<tools::ToolRegistry> tools_;
  SessionOptions options_;
  std::chrono::system_clock::time_point created_at_;

  mutable std::mutex mutex_;
  std::vector<Turn> history_;
};

} // namespace almanac::agent
