#include "almanac/agent/stream_assembler.hpp"

namespace almanac::agent {

void StreamAssembler::feed(const providers::CompletionChunk &chunk) {
  ++chunks_;
  auto &entry = entries_[chunk.entry];
  if (entry.role.empty() && !chunk.role.empty()) {
    entry.role = chunk.role;
  }
  entry.content += chunk.content;
  entry.reasoning += chunk.reasoning;
  entry.streamed = entry.streamed || chunk.streamed;

  if (!chunk.tool_call.has_value()) {
    return;
  }
  const auto &fragment = *chunk.tool_call;
  auto &call = entry.calls[fragment.index];
  if (call.id.empty() && !fragment.id.empty()) {
    call.id = fragment.id;
  }
  if (call.name.empty() && !fragment.name.empty()) {
    call.name = fragment.name;
  }
  call.arguments += fragment.arguments;
}

std::vector<CompletionMessage> StreamAssembler::messages() const {
  std::vector<CompletionMessage> out;
  out.reserve(entries_.size());
  for (const auto &[index, entry] : entries_) {
    CompletionMessage message{.entry = index,
                              .role = entry.role,
                              .content = entry.content,
                              .reasoning = entry.reasoning};
    if (message.role.empty() && entry.streamed) {
      message.role = "assistant";
    }
    for (const auto &[call_index, call] : entry.calls) {
      AssembledToolCall assembled = call;
      if (assembled.id.empty()) {
        assembled.id = "call_" + std::to_string(index) + "_" + std::to_string(call_index);
      }
      message.tool_calls.push_back(std::move(assembled));
    }
    out.push_back(std::move(message));
  }
  return out;
}

std::optional<CompletionMessage> select_reply(const std::vector<CompletionMessage> &messages) {
  for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
    if (it->role == "assistant") {
      return *it;
    }
  }
  return std::nullopt;
}

} // namespace almanac::agent
