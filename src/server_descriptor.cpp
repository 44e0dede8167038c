#include "mcp-discovery/server_descriptor.hpp"
#include <limits>

namespace mcpd {

namespace {

bool readString(const nlohmann::json &object, const char *field,
                std::string &out) {
  auto it = object.find(field);
  if (it == object.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool readAttributes(const nlohmann::json &object, const char *field,
                    AttributeMap &out) {
  auto it = object.find(field);
  if (it == object.end() || it->is_null()) {
    return true;
  }
  if (!it->is_object()) {
    return false;
  }
  for (const auto &[key, value] : it->items()) {
    out.emplace(key, value);
  }
  return true;
}

} // namespace

std::string ServerDescriptor::key() const {
  return this->host + ":" + std::to_string(this->port);
}

nlohmann::json ServerDescriptor::toJson() const {
  nlohmann::json object = nlohmann::json::object();
  object["name"] = this->name;
  object["version"] = this->version;
  object["host"] = this->host;
  object["port"] = this->port;
  object["protocol"] = this->protocol;
  object["capabilities"] = nlohmann::json::object();
  for (const auto &[key, value] : this->capabilities) {
    object["capabilities"][key] = value;
  }
  object["metadata"] = nlohmann::json::object();
  for (const auto &[key, value] : this->metadata) {
    object["metadata"][key] = value;
  }
  return object;
}

std::optional<ServerDescriptor>
ServerDescriptor::fromJson(const nlohmann::json &object) {
  if (!object.is_object()) {
    return std::nullopt;
  }

  ServerDescriptor descriptor;
  if (!readString(object, "name", descriptor.name) ||
      !readString(object, "version", descriptor.version) ||
      !readString(object, "host", descriptor.host)) {
    return std::nullopt;
  }

  auto port_it = object.find("port");
  if (port_it == object.end() || !port_it->is_number_integer()) {
    return std::nullopt;
  }
  if (port_it->is_number_unsigned()) {
    auto port = port_it->get<uint64_t>();
    if (port > std::numeric_limits<uint16_t>::max()) {
      return std::nullopt;
    }
    descriptor.port = static_cast<uint16_t>(port);
  } else {
    auto port = port_it->get<int64_t>();
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
      return std::nullopt;
    }
    descriptor.port = static_cast<uint16_t>(port);
  }

  auto protocol_it = object.find("protocol");
  if (protocol_it != object.end() && !protocol_it->is_null()) {
    if (!protocol_it->is_string()) {
      return std::nullopt;
    }
    descriptor.protocol = protocol_it->get<std::string>();
  }

  if (!readAttributes(object, "capabilities", descriptor.capabilities) ||
      !readAttributes(object, "metadata", descriptor.metadata)) {
    return std::nullopt;
  }

  return descriptor;
}

std::ostream &operator<<(std::ostream &os, const ServerDescriptor &descriptor) {
  os << "ServerDescriptor{name='" << descriptor.name << "', version='"
     << descriptor.version << "', address=" << descriptor.key()
     << ", protocol='" << descriptor.protocol << "', capabilities="
     << descriptor.capabilities.size()
     << ", metadata=" << descriptor.metadata.size() << "}";
  return os;
}

} // namespace mcpd
