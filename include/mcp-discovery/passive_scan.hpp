#pragma once

#include "constants.hpp"
#include "discovery_options.hpp"
#include "server_descriptor.hpp"
#include <chrono>
#include <vector>

namespace mcpd {

/**
 * @brief Listens for announcements for a bounded time
 *
 * Runs a listener for the given duration and returns the servers that were
 * live when it stopped. A listener that cannot start is logged and reported
 * as an empty result.
 *
 * @param duration How long to listen
 * @param options Group, port and eviction timeout to use
 * @return Live descriptors in registry key order
 */
std::vector<ServerDescriptor>
discoverServers(std::chrono::milliseconds duration =
                    constants::passive_scan::DEFAULT_DURATION,
                const DiscoveryOptions &options = DiscoveryOptions());

} // namespace mcpd
