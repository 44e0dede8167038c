#pragma once

#include "constants.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace mcpd {

/**
 * @brief Network and timing parameters shared by the broadcaster, the
 * listener and the discovery facade
 */
struct DiscoveryOptions {
  std::string group = constants::multicast::DEFAULT_GROUP;
  uint16_t port = constants::multicast::DEFAULT_PORT;
  // Local interface address used for sending and for the group membership
  std::string interface_address = constants::multicast::DEFAULT_INTERFACE;
  int ttl = constants::multicast::DEFAULT_TTL;
  bool loopback = constants::multicast::DEFAULT_LOOPBACK;

  std::chrono::milliseconds announce_interval =
      constants::broadcaster::DEFAULT_ANNOUNCE_INTERVAL;
  std::chrono::milliseconds eviction_timeout =
      constants::listener::DEFAULT_EVICTION_TIMEOUT;
  std::chrono::milliseconds receive_timeout =
      constants::listener::DEFAULT_RECEIVE_TIMEOUT;

  // Whether AutoDiscovery also keeps track of peers
  bool listen = true;
};

} // namespace mcpd
