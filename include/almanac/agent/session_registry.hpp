#pragma once

#include "almanac/agent/session.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace almanac::agent {

/// Process-wide map from session id to session. Lookups and creation are atomic, so two
/// connections racing on a new id end up with the same session.
class SessionRegistry {
public:
  using Factory = std::function<std::shared_ptr<AgentSession>(const std::string &id)>;

  explicit SessionRegistry(Factory factory);
  SessionRegistry(std::shared_ptr<providers::Provider> provider,
                  std::shared_ptr<tools::ToolRegistry> tools, SessionOptions options = {});

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  [[nodiscard]] std::shared_ptr<AgentSession> get_or_create(const std::string &id);
  [[nodiscard]] std::shared_ptr<AgentSession> find(const std::string &id) const;

  /// Resets history; the session object and its id stay. Returns false if absent.
  bool clear(const std::string &id);
  bool remove(const std::string &id);

  [[nodiscard]] bool contains(const std::string &id) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::vector<std::string> ids() const;

private:
  Factory factory_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<AgentSession>> sessions_;
};

} // namespace almanac::agent
