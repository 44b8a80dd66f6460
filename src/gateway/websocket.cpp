#include "almanac/gateway/websocket.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/gateway/connection.hpp"
#include "almanac/observability/global.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <sstream>
#include <string_view>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace almanac::gateway {

namespace {

constexpr std::size_t kMaxHandshakeBytes = 8 * 1024;
constexpr std::size_t kMaxFramePayloadBytes = 1024 * 1024;
constexpr int kListenBacklog = 64;
constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

constexpr std::uint8_t kOpText = 0x1u;
constexpr std::uint8_t kOpBinary = 0x2u;
constexpr std::uint8_t kOpClose = 0x8u;
constexpr std::uint8_t kOpPing = 0x9u;
constexpr std::uint8_t kOpPong = 0xAu;

enum class FrameStatus { Ok, Eof, Malformed };

ssize_t write_bytes(const int fd, SSL *ssl, const std::uint8_t *data, const std::size_t size) {
  if (ssl != nullptr) {
    return static_cast<ssize_t>(SSL_write(ssl, data, static_cast<int>(size)));
  }
  return send(fd, data, size, MSG_NOSIGNAL);
}

ssize_t read_bytes(const int fd, SSL *ssl, std::uint8_t *data, const std::size_t size) {
  if (ssl != nullptr) {
    return static_cast<ssize_t>(SSL_read(ssl, data, static_cast<int>(size)));
  }
  return recv(fd, data, size, 0);
}

bool send_all(const int fd, SSL *ssl, const std::uint8_t *data, const std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = write_bytes(fd, ssl, data + sent, size - sent);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

bool recv_exact(const int fd, SSL *ssl, std::uint8_t *data, const std::size_t size) {
  std::size_t received = 0;
  while (received < size) {
    const ssize_t n = read_bytes(fd, ssl, data + received, size - received);
    if (n <= 0) {
      return false;
    }
    received += static_cast<std::size_t>(n);
  }
  return true;
}

std::string lower_trimmed(const std::string &value) {
  return common::to_lower(common::trim(value));
}

std::string normalize_bind_host(const std::string &host) {
  const std::string lowered = lower_trimmed(host);
  if (lowered == "localhost" || lowered == "::1" || lowered == "[::1]") {
    return "127.0.0.1";
  }
  return common::trim(host);
}

std::unordered_map<std::string, std::string> parse_headers(const std::string &request) {
  std::unordered_map<std::string, std::string> headers;
  std::istringstream lines(request);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    if (first) {
      headers[":request-line"] = line;
      first = false;
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    headers[lower_trimmed(line.substr(0, colon))] = common::trim(line.substr(colon + 1));
  }
  return headers;
}

std::string websocket_accept(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());

  // EVP_EncodeBlock writes a trailing NUL after the 4*ceil(n/3) characters.
  std::string output(4 * ((digest.size() + 2) / 3) + 1, '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
                                      digest.data(), static_cast<int>(digest.size()));
  output.resize(static_cast<std::size_t>(written));
  return output;
}

std::string openssl_error_string() {
  const auto code = ERR_get_error();
  if (code == 0) {
    return "unknown openssl error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return std::string(buffer.data());
}

bool send_http_response(const int fd, SSL *ssl, const int status, const std::string &status_text,
                        const std::vector<std::pair<std::string, std::string>> &headers,
                        const std::string &body = "") {
  std::ostringstream response;
  response << "HTTP/1.1 " << status << " " << status_text << "\r\n";
  for (const auto &[k, v] : headers) {
    response << k << ": " << v << "\r\n";
  }
  response << "Content-Length: " << body.size() << "\r\n";
  response << "\r\n";
  response << body;
  const std::string text = response.str();
  return send_all(fd, ssl, reinterpret_cast<const std::uint8_t *>(text.data()), text.size());
}

bool send_http_error(const int fd, SSL *ssl, const int status, const std::string &status_text,
                     const std::string &error) {
  return send_http_response(fd, ssl, status, status_text, {{"Content-Type", "application/json"}},
                            "{\"error\":\"" + error + "\"}");
}

FrameStatus read_next_frame(const int fd, SSL *ssl, std::uint8_t &opcode, std::string &payload) {
  std::array<std::uint8_t, 2> header{};
  if (!recv_exact(fd, ssl, header.data(), header.size())) {
    return FrameStatus::Eof;
  }

  const bool fin = (header[0] & 0x80u) != 0;
  opcode = static_cast<std::uint8_t>(header[0] & 0x0Fu);
  const bool masked = (header[1] & 0x80u) != 0;
  std::uint64_t payload_len = static_cast<std::uint64_t>(header[1] & 0x7Fu);

  // Fragmented messages are not supported.
  if (!fin) {
    return FrameStatus::Malformed;
  }

  if (payload_len == 126u) {
    std::array<std::uint8_t, 2> ext{};
    if (!recv_exact(fd, ssl, ext.data(), ext.size())) {
      return FrameStatus::Eof;
    }
    payload_len = (static_cast<std::uint64_t>(ext[0]) << 8u) | static_cast<std::uint64_t>(ext[1]);
  } else if (payload_len == 127u) {
    std::array<std::uint8_t, 8> ext{};
    if (!recv_exact(fd, ssl, ext.data(), ext.size())) {
      return FrameStatus::Eof;
    }
    payload_len = 0;
    for (const auto byte : ext) {
      payload_len = (payload_len << 8u) | static_cast<std::uint64_t>(byte);
    }
  }

  if (!masked || payload_len > kMaxFramePayloadBytes ||
      payload_len > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
    return FrameStatus::Malformed;
  }

  std::array<std::uint8_t, 4> mask{};
  if (!recv_exact(fd, ssl, mask.data(), mask.size())) {
    return FrameStatus::Eof;
  }

  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(payload_len));
  if (!bytes.empty() && !recv_exact(fd, ssl, bytes.data(), bytes.size())) {
    return FrameStatus::Eof;
  }
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] ^= mask[i % mask.size()];
  }

  payload.assign(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  return FrameStatus::Ok;
}

bool send_frame(const int fd, SSL *ssl, const std::uint8_t opcode, const std::string &payload) {
  std::vector<std::uint8_t> frame;
  frame.reserve(payload.size() + 16);
  frame.push_back(static_cast<std::uint8_t>(0x80u | (opcode & 0x0Fu)));

  const auto size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<std::uint8_t>(size));
  } else if (size <= 65535u) {
    frame.push_back(126u);
    frame.push_back(static_cast<std::uint8_t>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(size & 0xFFu));
  } else {
    frame.push_back(127u);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<std::uint8_t>((size >> static_cast<std::size_t>(shift)) & 0xFFu));
    }
  }

  frame.insert(frame.end(), payload.begin(), payload.end());
  return send_all(fd, ssl, frame.data(), frame.size());
}

std::string close_payload(const std::uint16_t code) {
  std::string payload(2, '\0');
  payload[0] = static_cast<char>((code >> 8u) & 0xFFu);
  payload[1] = static_cast<char>(code & 0xFFu);
  return payload;
}

} // namespace

WebSocketServer::WebSocketServer(std::shared_ptr<agent::SessionRegistry> sessions)
    : sessions_(std::move(sessions)) {}

WebSocketServer::~WebSocketServer() { stop(); }

common::Status WebSocketServer::start(const WebSocketOptions &options) {
  if (running_) {
    return common::Status::error("websocket server already running");
  }
  if (common::trim(options.host).empty()) {
    return common::Status::error("websocket host is empty");
  }
  if (options.max_clients == 0) {
    return common::Status::error("websocket max_clients must be positive");
  }
  options_ = options;

  if (options_.tls_enabled) {
    auto tls = setup_tls();
    if (!tls.ok()) {
      return tls;
    }
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    close_listener();
    return common::Status::error(common::ErrorKind::Io,
                                 "failed to create websocket listen socket");
  }
  int reuse = 1;
  (void)setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options_.port);
  const std::string bind_host = normalize_bind_host(options_.host);
  if (inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
    close_listener();
    return common::Status::error("invalid websocket bind host: " + options_.host);
  }
  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string message = std::strerror(errno);
    close_listener();
    return common::Status::error(common::ErrorKind::Io, "websocket bind failed: " + message);
  }
  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string message = std::strerror(errno);
    close_listener();
    return common::Status::error(common::ErrorKind::Io, "websocket listen failed: " + message);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options_.port;
  }

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  return common::Status::success();
}

common::Status WebSocketServer::setup_tls() {
  if (options_.tls_cert_file.empty() || options_.tls_key_file.empty()) {
    return common::Status::error("websocket TLS requires cert and key file paths");
  }

  tls_ctx_ = SSL_CTX_new(TLS_server_method());
  if (tls_ctx_ == nullptr) {
    return common::Status::error("failed to initialize websocket TLS context: " +
                                 openssl_error_string());
  }
  SSL_CTX_set_min_proto_version(tls_ctx_, TLS1_2_VERSION);

  std::string failure;
  if (SSL_CTX_use_certificate_file(tls_ctx_, options_.tls_cert_file.c_str(), SSL_FILETYPE_PEM) <=
      0) {
    failure = "failed loading websocket TLS certificate: " + openssl_error_string();
  } else if (SSL_CTX_use_PrivateKey_file(tls_ctx_, options_.tls_key_file.c_str(),
                                         SSL_FILETYPE_PEM) <= 0) {
    failure = "failed loading websocket TLS private key: " + openssl_error_string();
  } else if (SSL_CTX_check_private_key(tls_ctx_) != 1) {
    failure = "websocket TLS private key does not match certificate: " + openssl_error_string();
  }
  if (!failure.empty()) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
    return common::Status::error(failure);
  }
  return common::Status::success();
}

void WebSocketServer::close_listener() {
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (tls_ctx_ != nullptr && !running_) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
  }
  bound_port_ = 0;
}

void WebSocketServer::stop() {
  if (!running_ && listen_fd_ < 0 && tls_ctx_ == nullptr) {
    return;
  }
  running_ = false;

  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  // Wake every client thread; each one releases its own socket on the way out.
  {
    std::unique_lock<std::mutex> lock(clients_mutex_);
    for (const auto &[fd, client] : clients_) {
      shutdown(fd, SHUT_RDWR);
    }
    clients_cv_.wait(lock, [this]() { return client_threads_ == 0; });
  }

  if (tls_ctx_ != nullptr) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
  }
  bound_port_ = 0;
}

bool WebSocketServer::is_running() const { return running_.load(); }

std::uint16_t WebSocketServer::port() const { return bound_port_; }

WebSocketStats WebSocketServer::stats() const {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  return {.connected_clients = clients_.size(), .total_connections = total_connections_.load()};
}

void WebSocketServer::publish_client_count() const {
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    count = clients_.size();
  }
  observability::record_metric(
      observability::ActiveConnectionsMetric{.count = static_cast<std::uint64_t>(count)});
}

void WebSocketServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client_fd = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client_fd < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    auto client = std::make_shared<ClientState>();
    client->fd = client_fd;
    client->id = "ws-" + std::to_string(++total_connections_);
    if (tls_ctx_ != nullptr) {
      client->ssl = SSL_new(tls_ctx_);
      if (client->ssl == nullptr) {
        observability::record_error("gateway", "SSL_new failed: " + openssl_error_string());
        shutdown(client_fd, SHUT_RDWR);
        close(client_fd);
        continue;
      }
      SSL_set_fd(client->ssl, client_fd);
    }
    {
      std::lock_guard<std::mutex> lock(clients_mutex_);
      if (clients_.size() >= options_.max_clients) {
        // Plain-text 503 before any TLS handshake; TLS clients just see the socket close.
        if (client->ssl == nullptr) {
          (void)send_http_error(client_fd, nullptr, 503, "Service Unavailable",
                                "too_many_websocket_clients");
        } else {
          SSL_free(client->ssl);
          client->ssl = nullptr;
        }
        shutdown(client_fd, SHUT_RDWR);
        close(client_fd);
        continue;
      }
      clients_[client_fd] = client;
      ++client_threads_;
    }
    publish_client_count();
    std::thread([this, client]() { client_loop(client); }).detach();
  }
}

void WebSocketServer::client_loop(const std::shared_ptr<ClientState> client) {
  const bool ready = (client->ssl == nullptr || SSL_accept(client->ssl) > 0) &&
                     perform_handshake(client);
  if (ready) {
    ConnectionHandler handler(client->id, sessions_, [this, client](const std::string &text) {
      return send_text_frame(client, text);
    });
    handler.on_open();

    while (running_) {
      std::uint8_t opcode = 0;
      std::string payload;
      const FrameStatus status = read_next_frame(client->fd, client->ssl, opcode, payload);
      if (status == FrameStatus::Eof) {
        break;
      }
      if (status == FrameStatus::Malformed) {
        {
          std::lock_guard<std::mutex> write_lock(client->write_mutex);
          (void)send_frame(client->fd, client->ssl, kOpClose, close_payload(1002));
        }
        handler.on_error("malformed websocket frame");
        break;
      }
      if (opcode == kOpClose) {
        std::lock_guard<std::mutex> write_lock(client->write_mutex);
        (void)send_frame(client->fd, client->ssl, kOpClose, close_payload(1000));
        break;
      }
      if (opcode == kOpPing) {
        std::lock_guard<std::mutex> write_lock(client->write_mutex);
        (void)send_frame(client->fd, client->ssl, kOpPong, payload);
        continue;
      }
      if (opcode == kOpPong || opcode == kOpBinary) {
        continue;
      }
      if (opcode == kOpText) {
        handler.on_text(payload);
      }
    }
    handler.on_close();
  }

  remove_client(client->fd);
  publish_client_count();
  std::lock_guard<std::mutex> lock(clients_mutex_);
  --client_threads_;
  clients_cv_.notify_all();
}

bool WebSocketServer::perform_handshake(const std::shared_ptr<ClientState> &client) const {
  if (client == nullptr || client->fd < 0) {
    return false;
  }

  const int fd = client->fd;
  SSL *ssl = client->ssl;
  std::string request;
  request.reserve(1024);
  std::array<char, 1024> buf{};
  while (request.size() < kMaxHandshakeBytes) {
    const ssize_t n =
        read_bytes(fd, ssl, reinterpret_cast<std::uint8_t *>(buf.data()), buf.size());
    if (n <= 0) {
      return false;
    }
    request.append(buf.data(), static_cast<std::size_t>(n));
    if (request.find("\r\n\r\n") != std::string::npos) {
      break;
    }
  }
  if (request.find("\r\n\r\n") == std::string::npos) {
    (void)send_http_error(fd, ssl, 400, "Bad Request", "invalid_websocket_handshake");
    return false;
  }

  const auto headers = parse_headers(request);
  const auto request_line_it = headers.find(":request-line");
  if (request_line_it == headers.end() || request_line_it->second.rfind("GET ", 0) != 0) {
    (void)send_http_error(fd, ssl, 405, "Method Not Allowed", "websocket_requires_get");
    return false;
  }

  const auto upgrade_it = headers.find("upgrade");
  const auto connection_it = headers.find("connection");
  const auto version_it = headers.find("sec-websocket-version");
  const auto key_it = headers.find("sec-websocket-key");
  if (upgrade_it == headers.end() || connection_it == headers.end() ||
      version_it == headers.end() || key_it == headers.end() ||
      lower_trimmed(upgrade_it->second) != "websocket" ||
      common::to_lower(connection_it->second).find("upgrade") == std::string::npos ||
      common::trim(version_it->second) != "13") {
    (void)send_http_error(fd, ssl, 400, "Bad Request", "missing_websocket_headers");
    return false;
  }

  const std::string accept_key = websocket_accept(common::trim(key_it->second));
  return send_http_response(fd, ssl, 101, "Switching Protocols",
                            {{"Upgrade", "websocket"},
                             {"Connection", "Upgrade"},
                             {"Sec-WebSocket-Accept", accept_key}});
}

void WebSocketServer::remove_client(const int fd) {
  std::shared_ptr<ClientState> client;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    auto it = clients_.find(fd);
    if (it == clients_.end()) {
      return;
    }
    client = it->second;
    clients_.erase(it);
  }
  std::lock_guard<std::mutex> write_lock(client->write_mutex);
  if (client->ssl != nullptr) {
    SSL_shutdown(client->ssl);
    SSL_free(client->ssl);
    client->ssl = nullptr;
  }
  if (client->fd >= 0) {
    shutdown(client->fd, SHUT_RDWR);
    close(client->fd);
    client->fd = -1;
  }
}

bool WebSocketServer::send_text_frame(const std::shared_ptr<ClientState> &client,
                                      const std::string &payload) const {
  if (client == nullptr) {
    return false;
  }
  std::lock_guard<std::mutex> write_lock(client->write_mutex);
  if (client->fd < 0) {
    return false;
  }
  return send_frame(client->fd, client->ssl, kOpText, payload);
}

} // namespace almanac::gateway
