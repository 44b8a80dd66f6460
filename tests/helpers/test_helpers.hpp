#pragma once

#include "almanac/config/schema.hpp"
#include "almanac/providers/traits.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace almanac::testing {

config::Config mock_config();

/// One canned completion: the chunks to stream, or an error to return instead.
struct ScriptedCompletion {
  std::vector<providers::CompletionChunk> chunks;
  std::optional<common::Status> error;
};

/// Assistant text streamed in a few pieces.
ScriptedCompletion text_completion(const std::string &text);
/// Assistant message requesting one tool call, arguments split over two fragments.
ScriptedCompletion tool_call_completion(const std::string &tool, const std::string &arguments,
                                        const std::string &call_id = "");

class ScriptedProvider final : public providers::Provider {
public:
  ScriptedProvider() = default;
  explicit ScriptedProvider(std::vector<ScriptedCompletion> script);

  void push(ScriptedCompletion completion);
  /// Served whenever the script is exhausted.
  void set_repeat(ScriptedCompletion completion);

  [[nodiscard]] common::Status stream_completion(const providers::CompletionRequest &request,
                                                 const providers::CompletionChunkCallback &on_chunk)
      override;
  [[nodiscard]] std::string name() const override { return "scripted"; }

  [[nodiscard]] std::size_t calls() const;
  [[nodiscard]] std::vector<providers::CompletionRequest> requests() const;

private:
  mutable std::mutex mutex_;
  std::deque<ScriptedCompletion> script_;
  std::optional<ScriptedCompletion> repeat_;
  std::vector<providers::CompletionRequest> requests_;
};

/// Answers "echo: <last user message>" after a delay and records how many calls overlapped.
class DelayedProvider final : public providers::Provider {
public:
  explicit DelayedProvider(std::chrono::milliseconds delay) : delay_(delay) {}

  [[nodiscard]] common::Status stream_completion(const providers::CompletionRequest &request,
                                                 const providers::CompletionChunkCallback &on_chunk)
      override;
  [[nodiscard]] std::string name() const override { return "delayed"; }

  [[nodiscard]] std::size_t max_in_flight() const { return max_in_flight_.load(); }
  [[nodiscard]] std::size_t calls() const { return calls_.load(); }

private:
  std::chrono::milliseconds delay_;
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> max_in_flight_{0};
  std::atomic<std::size_t> calls_{0};
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;

private:
  std::filesystem::path path_;
};

/// Minimal blocking websocket client for loopback tests.
class WsTestClient {
public:
  WsTestClient() = default;
  ~WsTestClient();

  WsTestClient(const WsTestClient &) = delete;
  WsTestClient &operator=(const WsTestClient &) = delete;

  /// Connects and completes the upgrade handshake; returns the HTTP status line on failure.
  [[nodiscard]] common::Status connect(std::uint16_t port);
  [[nodiscard]] bool send_text(const std::string &text);
  [[nodiscard]] bool send_raw(const std::string &bytes);
  /// Next text frame, or nullopt on timeout or close.
  [[nodiscard]] std::optional<std::string> read_text(std::chrono::milliseconds timeout =
                                                         std::chrono::milliseconds(5000));
  void close();

private:
  [[nodiscard]] bool read_exact(std::uint8_t *data, std::size_t size);

  int fd_ = -1;
};

} // namespace almanac::testing
