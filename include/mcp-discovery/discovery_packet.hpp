#pragma once

#include "server_descriptor.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace mcpd {

/**
 * @brief Announcement datagram
 *
 * Wire layout (network byte order):
 *   magic            4 bytes, ASCII "MCPD"
 *   protocolVersion  2 bytes
 *   payloadLength    2 bytes, exact length of payload
 *   payload          UTF-8 JSON object describing the server
 */
struct DiscoveryPacket {
  uint16_t protocolVersion;
  uint16_t payloadLength;
  ServerDescriptor descriptor;
};

/**
 * @brief Serializes a descriptor into an announcement datagram
 * @throws InvalidDescriptorError if a string is not valid UTF-8 or a
 * capability or metadata value holds NaN or infinity
 * @throws PacketTooLargeError if the payload does not fit one datagram
 */
std::vector<uint8_t> encodePacket(const ServerDescriptor &descriptor);

/**
 * @brief Parses an announcement datagram
 *
 * Short buffers, foreign magic tags, length mismatches and payloads that are
 * not a valid descriptor all yield std::nullopt. Never throws.
 */
std::optional<DiscoveryPacket> decodePacket(const uint8_t *data, size_t size);

std::optional<DiscoveryPacket> decodePacket(const std::vector<uint8_t> &buffer);

std::optional<ServerDescriptor>
decodeDescriptor(const std::vector<uint8_t> &buffer);

} // namespace mcpd
