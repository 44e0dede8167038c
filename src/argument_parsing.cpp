#include "mcp-discovery/argument_parsing.hpp"
#include "mcp-discovery/constants.hpp"
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace mcpd {

uint16_t parsePort(const std::string &value) {
  size_t consumed = 0;
  int port = std::stoi(value, &consumed);
  if (consumed != value.size()) {
    throw std::invalid_argument("invalid port: " + value);
  }
  if (port < 0 || port > 65535) {
    throw std::out_of_range("port out of range: " + value);
  }
  return static_cast<uint16_t>(port);
};

std::chrono::milliseconds parseSeconds(const std::string &value,
                                       bool allow_zero) {
  size_t consumed = 0;
  double seconds = std::stod(value, &consumed);
  if (consumed != value.size()) {
    throw std::invalid_argument("invalid duration: " + value);
  }
  if (!std::isfinite(seconds) || seconds < 0 ||
      seconds > constants::command_line::MAX_DURATION_SECONDS) {
    throw std::out_of_range("duration out of range: " + value);
  }

  std::chrono::milliseconds duration(static_cast<int64_t>(seconds * 1000));
  if (!allow_zero && duration.count() == 0) {
    throw std::out_of_range("duration must be at least 1 ms: " + value);
  }
  return duration;
};

} // namespace mcpd
