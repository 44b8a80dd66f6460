#pragma once

#include "almanac/providers/traits.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace almanac::agent {

struct AssembledToolCall {
  std::string id;
  std::string name;
  std::string arguments;
};

struct CompletionMessage {
  std::size_t entry = 0;
  std::string role;
  std::string content;
  std::string reasoning;
  std::vector<AssembledToolCall> tool_calls;
};

/// Collects streamed completion chunks into whole messages. Nothing is exposed until the
/// caller asks for messages() after the stream has ended. A streamed entry that never names
/// its role is an assistant message.
class StreamAssembler {
public:
  void feed(const providers::CompletionChunk &chunk);

  [[nodiscard]] std::vector<CompletionMessage> messages() const;
  [[nodiscard]] std::size_t chunk_count() const { return chunks_; }

private:
  struct Entry {
    std::string role;
    std::string content;
    std::string reasoning;
    std::map<std::size_t, AssembledToolCall> calls;
    bool streamed = false;
  };

  std::map<std::size_t, Entry> entries_;
  std::size_t chunks_ = 0;
};

/// The last entry whose role is "assistant".
[[nodiscard]] std::optional<CompletionMessage>
select_reply(const std::vector<CompletionMessage> &messages);

} // namespace almanac::agent
