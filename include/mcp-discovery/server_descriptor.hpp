#pragma once

#include "constants.hpp"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace mcpd {

/**
 * @brief Free-form structured values keyed by name
 *
 * Used for both the capabilities and the metadata of a server. The map is
 * ordered, so equality does not depend on insertion order.
 */
using AttributeMap = std::map<std::string, nlohmann::json>;

/**
 * @brief Identity, network location and capabilities of one announce-able
 * server
 */
struct ServerDescriptor {
  std::string name;
  std::string version;
  std::string host;
  uint16_t port = 0;
  std::string protocol = constants::descriptor::DEFAULT_PROTOCOL;
  AttributeMap capabilities;
  AttributeMap metadata;

  bool operator==(const ServerDescriptor &other) const = default;

  /**
   * @brief Registry key of the descriptor
   * @return "{host}:{port}"
   */
  std::string key() const;

  nlohmann::json toJson() const;

  /**
   * @brief Builds a descriptor from its JSON object form
   *
   * name, version and host must be strings and port an integer in the
   * 0-65535 range. protocol, capabilities and metadata are optional; when
   * present they must be a string and JSON objects respectively. Unknown
   * fields are ignored.
   *
   * @param object Parsed JSON value
   * @return optional containing the descriptor or std::nullopt when the
   * value does not follow the schema
   */
  static std::optional<ServerDescriptor> fromJson(const nlohmann::json &object);
};

std::ostream &operator<<(std::ostream &os, const ServerDescriptor &descriptor);

} // namespace mcpd
