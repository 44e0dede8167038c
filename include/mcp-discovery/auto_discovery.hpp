#pragma once

#include "announcement_broadcaster.hpp"
#include "announcement_listener.hpp"
#include "discovery_options.hpp"
#include "local_server_descriptor.hpp"
#include <memory>
#include <mutex>
#include <vector>

namespace mcpd {

/**
 * @brief Announces the local server and, optionally, tracks its peers
 *
 * Composes one AnnouncementBroadcaster and one AnnouncementListener behind a
 * single enable switch. A disabled instance never opens a socket nor spawns a
 * thread.
 */
class AutoDiscovery {
public:
  explicit AutoDiscovery(ServerDescriptor descriptor, bool enabled = true,
                         const DiscoveryOptions &options = DiscoveryOptions());

  ~AutoDiscovery();

  AutoDiscovery(const AutoDiscovery &) = delete;
  AutoDiscovery &operator=(const AutoDiscovery &) = delete;

  /**
   * @brief Starts announcing, and listening when options.listen is set
   *
   * No-op when disabled or already started.
   *
   * @throws DiscoveryError if the options are rejected or a socket cannot be
   * set up; nothing is left running in that case
   */
  void start();

  /**
   * @brief Stops whatever start() started and releases its sockets
   *
   * Idempotent, safe without a prior start().
   */
  void stop();

  /**
   * @brief Replaces the capabilities of the local descriptor
   *
   * The running broadcaster reads the same descriptor instance, so the next
   * periodic announcement carries the new value.
   */
  void updateCapabilities(AttributeMap capabilities);

  void updateMetadata(AttributeMap metadata);

  ServerDescriptor serverDescriptor() const;

  /**
   * @brief Live peers seen by the listener
   * @return Empty when discovery is not listening
   */
  std::vector<ServerDescriptor> getLiveDescriptors() const;

  bool isEnabled() const { return enabled_; }
  bool isBroadcasting() const;
  bool isListening() const;

  const AnnouncementBroadcaster *broadcaster() const;

  const DiscoveryOptions &options() const { return options_; }

private:
  std::shared_ptr<LocalServerDescriptor> descriptor_;
  const bool enabled_;
  const DiscoveryOptions options_;

  mutable std::mutex mutex_;
  std::unique_ptr<AnnouncementBroadcaster> broadcaster_;
  std::unique_ptr<AnnouncementListener> listener_;
};

/**
 * @brief Keeps a discovery service started for the lifetime of the scope
 *
 * The constructor calls start() and the destructor calls stop() exactly
 * once, including during stack unwinding.
 */
template <typename Service> class ScopedDiscovery {
public:
  explicit ScopedDiscovery(Service &service) : service_(service) {
    service_.start();
  }

  ~ScopedDiscovery() { service_.stop(); }

  ScopedDiscovery(const ScopedDiscovery &) = delete;
  ScopedDiscovery &operator=(const ScopedDiscovery &) = delete;

  Service &operator*() const { return service_; }
  Service *operator->() const { return &service_; }

private:
  Service &service_;
};

} // namespace mcpd
