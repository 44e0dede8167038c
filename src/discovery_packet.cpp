#include "mcp-discovery/constants.hpp"
#include "mcp-discovery/discovery_error.hpp"
#include "mcp-discovery/discovery_packet.hpp"
#include <cmath>
#include <cstring>
#include <netinet/in.h>
#include <string>

namespace mcpd {

namespace {

// JSON has no representation for NaN or infinity
bool hasNonFiniteNumber(const nlohmann::json &value) {
  if (value.is_number_float()) {
    return !std::isfinite(value.get<double>());
  }
  if (value.is_structured()) {
    for (const auto &item : value) {
      if (hasNonFiniteNumber(item)) {
        return true;
      }
    }
  }
  return false;
}

} // namespace

std::vector<uint8_t> encodePacket(const ServerDescriptor &descriptor) {
  nlohmann::json object = descriptor.toJson();
  if (hasNonFiniteNumber(object)) {
    throw InvalidDescriptorError("non-finite number in capabilities or "
                                 "metadata");
  }

  std::string payload;
  try {
    payload = object.dump();
  } catch (const nlohmann::json::type_error &e) {
    throw InvalidDescriptorError(e.what());
  }
  if (payload.size() > constants::packet::MAX_PAYLOAD_SIZE) {
    throw PacketTooLargeError(payload.size());
  }

  uint16_t version = htons(constants::packet::PROTOCOL_VERSION);
  uint16_t length = htons(static_cast<uint16_t>(payload.size()));

  std::vector<uint8_t> buffer;
  buffer.reserve(constants::packet::HEADER_SIZE + payload.size());
  buffer.insert(buffer.end(), constants::packet::MAGIC,
                constants::packet::MAGIC + constants::packet::MAGIC_SIZE);
  buffer.insert(buffer.end(), (uint8_t *)&version,
                (uint8_t *)&version + sizeof(version));
  buffer.insert(buffer.end(), (uint8_t *)&length,
                (uint8_t *)&length + sizeof(length));
  buffer.insert(buffer.end(), payload.begin(), payload.end());
  return buffer;
};

std::optional<DiscoveryPacket> decodePacket(const uint8_t *data, size_t size) {
  if (data == nullptr || size < constants::packet::HEADER_SIZE) {
    return std::nullopt;
  }
  if (std::memcmp(data, constants::packet::MAGIC,
                  constants::packet::MAGIC_SIZE) != 0) {
    return std::nullopt;
  }

  size_t offset = constants::packet::MAGIC_SIZE;
  DiscoveryPacket packet;

  std::memcpy(&packet.protocolVersion, data + offset, sizeof(uint16_t));
  packet.protocolVersion = ntohs(packet.protocolVersion);
  offset += sizeof(uint16_t);

  std::memcpy(&packet.payloadLength, data + offset, sizeof(uint16_t));
  packet.payloadLength = ntohs(packet.payloadLength);
  offset += sizeof(uint16_t);

  if (packet.payloadLength != size - offset) {
    return std::nullopt;
  }

  auto payload = nlohmann::json::parse(data + offset, data + size, nullptr,
                                       false);
  if (payload.is_discarded()) {
    return std::nullopt;
  }

  auto descriptor = ServerDescriptor::fromJson(payload);
  if (!descriptor) {
    return std::nullopt;
  }
  packet.descriptor = std::move(*descriptor);
  return packet;
};

std::optional<DiscoveryPacket>
decodePacket(const std::vector<uint8_t> &buffer) {
  return decodePacket(buffer.data(), buffer.size());
};

std::optional<ServerDescriptor>
decodeDescriptor(const std::vector<uint8_t> &buffer) {
  auto packet = decodePacket(buffer);
  if (!packet) {
    return std::nullopt;
  }
  return std::move(packet->descriptor);
};

} // namespace mcpd
