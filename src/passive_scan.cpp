#include "mcp-discovery/announcement_listener.hpp"
#include "mcp-discovery/logger.hpp"
#include "mcp-discovery/passive_scan.hpp"
#include <exception>
#include <string>
#include <thread>

namespace mcpd {

std::vector<ServerDescriptor>
discoverServers(std::chrono::milliseconds duration,
                const DiscoveryOptions &options) {
  AnnouncementListener listener(options);
  try {
    listener.start();
  } catch (const std::exception &e) {
    Logger::log(LogLevel::ERROR,
                "Server discovery failed: " + std::string(e.what()));
    return {};
  }

  std::this_thread::sleep_for(duration);
  listener.stop();
  listener.wait();

  auto servers = listener.getLiveDescriptors();
  Logger::log(LogLevel::INFO,
              "Discovered " + std::to_string(servers.size()) + " server(s)");
  return servers;
};

} // namespace mcpd
