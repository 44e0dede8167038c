#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace constants {

namespace packet {
static constexpr char MAGIC[4] = {'M', 'C', 'P', 'D'};
static constexpr size_t MAGIC_SIZE = sizeof(MAGIC);
static constexpr uint16_t PROTOCOL_VERSION = 1;
static constexpr size_t HEADER_SIZE =
    MAGIC_SIZE + sizeof(uint16_t) + sizeof(uint16_t);
static constexpr size_t MAX_DATAGRAM_SIZE = 65507;
static constexpr size_t MAX_PAYLOAD_SIZE = MAX_DATAGRAM_SIZE - HEADER_SIZE;
} // namespace packet

namespace multicast {
static constexpr const char *DEFAULT_GROUP = "239.255.77.77";
static constexpr uint16_t DEFAULT_PORT = 47800;
static constexpr const char *DEFAULT_INTERFACE = "0.0.0.0";
static constexpr int DEFAULT_TTL = 1;
static constexpr bool DEFAULT_LOOPBACK = true;
} // namespace multicast

namespace broadcaster {
static constexpr std::chrono::milliseconds DEFAULT_ANNOUNCE_INTERVAL{5000};
} // namespace broadcaster

namespace listener {
static constexpr std::chrono::milliseconds DEFAULT_EVICTION_TIMEOUT{30000};
static constexpr std::chrono::milliseconds DEFAULT_RECEIVE_TIMEOUT{250};
} // namespace listener

namespace descriptor {
static constexpr const char *DEFAULT_PROTOCOL = "stdio";
} // namespace descriptor

namespace passive_scan {
static constexpr std::chrono::milliseconds DEFAULT_DURATION{3000};
} // namespace passive_scan

namespace command_line {
static constexpr double MAX_DURATION_SECONDS = 365.0 * 24 * 60 * 60;
} // namespace command_line

} // namespace constants
