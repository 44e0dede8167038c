#include <chrono>
#include <mcp-discovery/remote_server_registry.hpp>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcpd {

bool RemoteServerRegistry::isStale_(
    const RemoteServer &server,
    std::chrono::system_clock::time_point now) const {
  return now - server.lastSeen > this->eviction_timeout_;
}

size_t
RemoteServerRegistry::eraseStale_(std::chrono::system_clock::time_point now) {
  size_t removed = 0;
  for (auto it = servers_.begin(); it != servers_.end();) {
    if (this->isStale_(it->second, now)) {
      it = this->servers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

void RemoteServerRegistry::addOrUpdate(
    const ServerDescriptor &descriptor,
    std::chrono::system_clock::time_point last_seen) {
  std::unique_lock lock(this->mutex_);
  this->eraseStale_(std::chrono::system_clock::now());
  this->servers_.insert_or_assign(
      descriptor.key(),
      RemoteServer{.descriptor = descriptor, .lastSeen = last_seen});
};

std::vector<ServerDescriptor> RemoteServerRegistry::getLiveDescriptors() const {
  return this->getLiveDescriptors(std::chrono::system_clock::now());
};

std::vector<ServerDescriptor> RemoteServerRegistry::getLiveDescriptors(
    std::chrono::system_clock::time_point now) const {
  std::shared_lock lock(this->mutex_);
  std::vector<ServerDescriptor> live;
  live.reserve(this->servers_.size());
  for (const auto &[key, server] : this->servers_) {
    if (!this->isStale_(server, now)) {
      live.push_back(server.descriptor);
    }
  }
  return live;
};

std::optional<ServerDescriptor>
RemoteServerRegistry::find(const std::string &host, uint16_t port) const {
  std::shared_lock lock(this->mutex_);

  auto it = this->servers_.find(host + ":" + std::to_string(port));
  if (it == this->servers_.end() ||
      this->isStale_(it->second, std::chrono::system_clock::now())) {
    return std::nullopt;
  }
  return it->second.descriptor;
};

size_t RemoteServerRegistry::size() const {
  std::shared_lock lock(this->mutex_);
  return this->servers_.size();
};

size_t RemoteServerRegistry::cleanupStaleEntries() {
  std::unique_lock lock(this->mutex_);
  return this->eraseStale_(std::chrono::system_clock::now());
};

void RemoteServerRegistry::clear() {
  std::unique_lock lock(this->mutex_);
  this->servers_.clear();
};

} // namespace mcpd
