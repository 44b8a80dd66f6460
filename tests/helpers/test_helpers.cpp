#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <random>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace almanac::testing {

config::Config mock_config() {
  config::Config config;
  config.provider.api_key = "test-key";
  config.provider.base_url = "http://127.0.0.1:9/v1";
  config.provider.max_retries = 0;
  config.provider.backoff_ms = 1;
  config.observability.backend = "none";
  config.notifier.enabled = false;
  return config;
}

ScriptedCompletion text_completion(const std::string &text) {
  ScriptedCompletion completion;
  const std::size_t half = text.size() / 2;
  completion.chunks.push_back({.entry = 0, .role = "assistant", .content = text.substr(0, half)});
  completion.chunks.push_back({.entry = 0, .content = text.substr(half)});
  return completion;
}

ScriptedCompletion tool_call_completion(const std::string &tool, const std::string &arguments,
                                        const std::string &call_id) {
  ScriptedCompletion completion;
  const std::size_t half = arguments.size() / 2;
  completion.chunks.push_back(
      {.entry = 0,
       .role = "assistant",
       .tool_call = providers::ToolCallFragment{
           .index = 0, .id = call_id, .name = tool, .arguments = arguments.substr(0, half)}});
  completion.chunks.push_back(
      {.entry = 0,
       .tool_call = providers::ToolCallFragment{.index = 0, .arguments = arguments.substr(half)}});
  return completion;
}

ScriptedProvider::ScriptedProvider(std::vector<ScriptedCompletion> script)
    : script_(script.begin(), script.end()) {}

void ScriptedProvider::push(ScriptedCompletion completion) {
  std::lock_guard<std::mutex> lock(mutex_);
  script_.push_back(std::move(completion));
}

void ScriptedProvider::set_repeat(ScriptedCompletion completion) {
  std::lock_guard<std::mutex> lock(mutex_);
  repeat_ = std::move(completion);
}

common::Status ScriptedProvider::stream_completion(const providers::CompletionRequest &request,
                                                   const providers::CompletionChunkCallback &on_chunk) {
  ScriptedCompletion next;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (!script_.empty()) {
      next = std::move(script_.front());
      script_.pop_front();
    } else if (repeat_.has_value()) {
      next = *repeat_;
    } else {
      return common::Status::error(common::ErrorKind::Provider, "script exhausted");
    }
  }
  if (next.error.has_value()) {
    return *next.error;
  }
  for (const auto &chunk : next.chunks) {
    on_chunk(chunk);
  }
  return common::Status::success();
}

std::size_t ScriptedProvider::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.size();
}

std::vector<providers::CompletionRequest> ScriptedProvider::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

common::Status DelayedProvider::stream_completion(const providers::CompletionRequest &request,
                                                  const providers::CompletionChunkCallback &on_chunk) {
  ++calls_;
  const std::size_t now_in_flight = ++in_flight_;
  std::size_t seen = max_in_flight_.load();
  while (now_in_flight > seen && !max_in_flight_.compare_exchange_weak(seen, now_in_flight)) {
  }

  std::string last_user;
  for (const auto &message : request.messages) {
    if (message.role == "user") {
      last_user = message.content;
    }
  }
  on_chunk({.entry = 0, .role = "assistant", .content = "echo: "});
  std::this_thread::sleep_for(delay_);
  on_chunk({.entry = 0, .content = last_user});

  --in_flight_;
  return common::Status::success();
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("almanac-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempWorkspace::create_file(const std::string &name,
                                                 const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
  return file_path;
}

std::string TempWorkspace::read_file(const std::string &name) const {
  std::ifstream in(path_ / name);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

WsTestClient::~WsTestClient() { close(); }

common::Status WsTestClient::connect(const std::uint16_t port) {
  fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (fd_ < 0) {
    return common::Status::error("socket failed");
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (::connect(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    close();
    return common::Status::error("connect failed");
  }

  timeval tv{};
  tv.tv_sec = 5;
  setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  const std::string request = "GET / HTTP/1.1\r\n"
                              "Host: 127.0.0.1\r\n"
                              "Upgrade: websocket\r\n"
                              "Connection: Upgrade\r\n"
                              "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
                              "Sec-WebSocket-Version: 13\r\n\r\n";
  if (!send_raw(request)) {
    return common::Status::error("handshake send failed");
  }

  // Byte by byte so no frame data is consumed with the headers.
  std::string response;
  char ch = 0;
  while (response.find("\r\n\r\n") == std::string::npos && response.size() < 8192) {
    if (recv(fd_, &ch, 1, 0) != 1) {
      return common::Status::error("handshake read failed: " + response);
    }
    response.push_back(ch);
  }
  const std::string status_line = response.substr(0, response.find("\r\n"));
  if (status_line.find(" 101 ") == std::string::npos) {
    return common::Status::error(status_line);
  }
  if (response.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") == std::string::npos) {
    return common::Status::error("bad Sec-WebSocket-Accept");
  }
  return common::Status::success();
}

bool WsTestClient::send_raw(const std::string &bytes) {
  std::size_t sent = 0;
  while (sent < bytes.size()) {
    const ssize_t n = send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

bool WsTestClient::send_text(const std::string &text) {
  std::string frame;
  frame.push_back(static_cast<char>(0x81));
  const std::size_t size = text.size();
  if (size <= 125) {
    frame.push_back(static_cast<char>(0x80 | size));
  } else if (size <= 65535) {
    frame.push_back(static_cast<char>(0x80 | 126));
    frame.push_back(static_cast<char>((size >> 8) & 0xFF));
    frame.push_back(static_cast<char>(size & 0xFF));
  } else {
    frame.push_back(static_cast<char>(0x80 | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((size >> shift) & 0xFF));
    }
  }
  const std::array<std::uint8_t, 4> mask{0x12, 0x34, 0x56, 0x78};
  for (const auto byte : mask) {
    frame.push_back(static_cast<char>(byte));
  }
  for (std::size_t i = 0; i < size; ++i) {
    frame.push_back(static_cast<char>(static_cast<std::uint8_t>(text[i]) ^ mask[i % 4]));
  }
  return send_raw(frame);
}

bool WsTestClient::read_exact(std::uint8_t *data, const std::size_t size) {
  std::size_t received = 0;
  while (received < size) {
    const ssize_t n = recv(fd_, data + received, size - received, 0);
    if (n <= 0) {
      return false;
    }
    received += static_cast<std::size_t>(n);
  }
  return true;
}

std::optional<std::string> WsTestClient::read_text(const std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    return std::nullopt;
  }
  timeval tv{};
  tv.tv_sec = static_cast<long>(timeout.count() / 1000);
  tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
  setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  while (true) {
    std::array<std::uint8_t, 2> header{};
    if (!read_exact(header.data(), header.size())) {
      return std::nullopt;
    }
    const std::uint8_t opcode = header[0] & 0x0F;
    std::uint64_t length = header[1] & 0x7F;
    if (length == 126) {
      std::array<std::uint8_t, 2> ext{};
      if (!read_exact(ext.data(), ext.size())) {
        return std::nullopt;
      }
      length = (static_cast<std::uint64_t>(ext[0]) << 8) | ext[1];
    } else if (length == 127) {
      std::array<std::uint8_t, 8> ext{};
      if (!read_exact(ext.data(), ext.size())) {
        return std::nullopt;
      }
      length = 0;
      for (const auto byte : ext) {
        length = (length << 8) | byte;
      }
    }
    std::string payload(static_cast<std::size_t>(length), '\0');
    if (length > 0 &&
        !read_exact(reinterpret_cast<std::uint8_t *>(payload.data()), payload.size())) {
      return std::nullopt;
    }
    if (opcode == 0x8) {
      return std::nullopt;
    }
    if (opcode == 0x1) {
      return payload;
    }
  }
}

void WsTestClient::close() {
  if (fd_ >= 0) {
    shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace almanac::testing
