#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mcpd {

/**
 * @brief Parses a decimal UDP port
 * @throws std::invalid_argument if the value is not a whole number
 * @throws std::out_of_range if it is outside 0-65535
 */
uint16_t parsePort(const std::string &value);

/**
 * @brief Parses a duration given in (fractional) seconds
 *
 * @param value Text such as "2" or "0.5"
 * @param allow_zero Whether a duration that rounds down to 0 ms is accepted
 * @throws std::invalid_argument if the value is not a number
 * @throws std::out_of_range if it is negative, not finite, longer than a
 * year, or zero when allow_zero is false
 */
std::chrono::milliseconds parseSeconds(const std::string &value,
                                       bool allow_zero = true);

} // namespace mcpd
