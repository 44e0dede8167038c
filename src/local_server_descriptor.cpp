#include <mcp-discovery/local_server_descriptor.hpp>
#include <mutex>

namespace mcpd {

ServerDescriptor LocalServerDescriptor::snapshot() const {
  std::shared_lock lock(mutex_);

  return descriptor_;
};

AttributeMap LocalServerDescriptor::capabilities() const {
  std::shared_lock lock(mutex_);

  return descriptor_.capabilities;
};

void LocalServerDescriptor::setCapabilities(AttributeMap capabilities) {
  std::unique_lock lock(mutex_);

  descriptor_.capabilities = std::move(capabilities);
};

void LocalServerDescriptor::setMetadata(AttributeMap metadata) {
  std::unique_lock lock(mutex_);

  descriptor_.metadata = std::move(metadata);
};

} // namespace mcpd
