#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mcpd {

class DiscoveryError : public std::runtime_error {
public:
  explicit DiscoveryError(const std::string &message)
      : std::runtime_error(message) {}
};

class SocketError : public DiscoveryError {
public:
  SocketError(const std::string &operation, int error_number);

  int errorNumber() const { return error_number_; }

private:
  int error_number_;
};

class PacketTooLargeError : public DiscoveryError {
public:
  explicit PacketTooLargeError(size_t payload_size)
      : DiscoveryError("Discovery payload of " + std::to_string(payload_size) +
                       " bytes does not fit in a single datagram") {}
};

class InvalidDescriptorError : public DiscoveryError {
public:
  explicit InvalidDescriptorError(const std::string &reason)
      : DiscoveryError("Descriptor cannot be announced: " + reason) {}
};

} // namespace mcpd
