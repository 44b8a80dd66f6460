#pragma once

#include "almanac/agent/session_registry.hpp"
#include "almanac/common/result.hpp"

#include <openssl/ssl.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace almanac::gateway {

struct WebSocketOptions {
  std::string host = "127.0.0.1";
  /// 0 binds an ephemeral port; see WebSocketServer::port().
  std::uint16_t port = 0;
  std::size_t max_clients = 256;
  bool tls_enabled = false;
  std::string tls_cert_file;
  std::string tls_key_file;
};

struct WebSocketStats {
  std::size_t connected_clients = 0;
  std::size_t total_connections = 0;
};

/// RFC 6455 server. Each accepted client gets its own thread driving a ConnectionHandler.
class WebSocketServer {
public:
  explicit WebSocketServer(std::shared_ptr<agent::SessionRegistry> sessions);
  ~WebSocketServer();

  WebSocketServer(const WebSocketServer &) = delete;
  WebSocketServer &operator=(const WebSocketServer &) = delete;

  [[nodiscard]] common::Status start(const WebSocketOptions &options);
  /// Closes the listener and every client socket, then waits for client threads to finish.
  void stop();

  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] WebSocketStats stats() const;

private:
  struct ClientState {
    int fd = -1;
    SSL *ssl = nullptr;
    std::string id;
    std::mutex write_mutex;
  };

  [[nodiscard]] common::Status setup_tls();
  void close_listener();
  void accept_loop();
  void client_loop(std::shared_ptr<ClientState> client);
  [[nodiscard]] bool perform_handshake(const std::shared_ptr<ClientState> &client) const;
  void remove_client(int fd);
  void publish_client_count() const;

  [[nodiscard]] bool send_text_frame(const std::shared_ptr<ClientState> &client,
                                     const std::string &payload) const;

  std::shared_ptr<agent::SessionRegistry> sessions_;
  WebSocketOptions options_;
  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;
  SSL_CTX *tls_ctx_ = nullptr;
  std::atomic<std::size_t> total_connections_{0};

  mutable std::mutex clients_mutex_;
  std::condition_variable clients_cv_;
  std::size_t client_threads_ = 0;
  std::unordered_map<int, std::shared_ptr<ClientState>> clients_;
};

} // namespace almanac::gateway
