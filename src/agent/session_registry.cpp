#include "almanac/agent/session_registry.hpp"

#include "almanac/observability/global.hpp"

#include <algorithm>

namespace almanac::agent {

SessionRegistry::SessionRegistry(Factory factory) : factory_(std::move(factory)) {}

SessionRegistry::SessionRegistry(std::shared_ptr<providers::Provider> provider,
                                 std::shared_ptr<tools::ToolRegistry> tools,
                                 SessionOptions options)
    : factory_([provider = std::move(provider), tools = std::move(tools),
                options = std::move(options)](const std::string &id) {
        return std::make_shared<AgentSession>(id, provider, tools, options);
      }) {}

std::shared_ptr<AgentSession> SessionRegistry::get_or_create(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it != sessions_.end()) {
    return it->second;
  }
  auto session = factory_(id);
  sessions_.emplace(id, session);
  observability::record_metric(
      observability::ActiveSessionsMetric{.count = static_cast<std::uint64_t>(sessions_.size())});
  return session;
}

std::shared_ptr<AgentSession> SessionRegistry::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::clear(const std::string &id) {
  auto session = find(id);
  if (!session) {
    return false;
  }
  session->clear();
  return true;
}

bool SessionRegistry::remove(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sessions_.erase(id) == 0) {
    return false;
  }
  observability::record_metric(
      observability::ActiveSessionsMetric{.count = static_cast<std::uint64_t>(sessions_.size())});
  return true;
}

bool SessionRegistry::contains(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.contains(id);
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<std::string> SessionRegistry::ids() const {
  std::vector<std::string> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(sessions_.size());
    for (const auto &[id, session] : sessions_) {
      out.push_back(id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace almanac::agent
