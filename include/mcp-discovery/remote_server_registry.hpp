#pragma once

#include "server_descriptor.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcpd {

typedef struct {
  ServerDescriptor descriptor;
  std::chrono::system_clock::time_point lastSeen;
} RemoteServer;

/**
 * @brief Time-indexed cache of servers announced by other processes
 *
 * Holds at most one entry per (host, port). Entries older than the eviction
 * timeout are never returned by reads; they are physically removed on the
 * next write or by cleanupStaleEntries().
 */
class RemoteServerRegistry {
public:
  explicit RemoteServerRegistry(std::chrono::milliseconds eviction_timeout)
      : eviction_timeout_(eviction_timeout) {};
  ~RemoteServerRegistry() = default;

  RemoteServerRegistry(const RemoteServerRegistry &) = delete;
  RemoteServerRegistry &operator=(const RemoteServerRegistry &) = delete;

  void addOrUpdate(const ServerDescriptor &descriptor,
                   std::chrono::system_clock::time_point last_seen);

  std::vector<ServerDescriptor> getLiveDescriptors() const;

  std::vector<ServerDescriptor>
  getLiveDescriptors(std::chrono::system_clock::time_point now) const;

  std::optional<ServerDescriptor> find(const std::string &host,
                                       uint16_t port) const;

  size_t size() const;

  size_t cleanupStaleEntries();

  void clear();

  std::chrono::milliseconds evictionTimeout() const {
    return eviction_timeout_;
  }

private:
  bool isStale_(const RemoteServer &server,
                std::chrono::system_clock::time_point now) const;

  size_t eraseStale_(std::chrono::system_clock::time_point now);

  mutable std::shared_mutex mutex_;
  std::map<std::string, RemoteServer> servers_;
  const std::chrono::milliseconds eviction_timeout_;
};

} // namespace mcpd
