#include "mcp-discovery/discovery_error.hpp"
#include <cstring>

namespace mcpd {

SocketError::SocketError(const std::string &operation, int error_number)
    : DiscoveryError(operation + ": " + std::string(strerror(error_number))),
      error_number_(error_number) {}

} // namespace mcpd
