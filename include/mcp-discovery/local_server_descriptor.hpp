#pragma once

#include "server_descriptor.hpp"
#include <shared_mutex>

namespace mcpd {

/**
 * @brief Shared, lock-guarded cell holding the locally announced descriptor
 *
 * The facade and the broadcaster hold the same instance, so a capability
 * update becomes visible to the very next announcement. Implements the
 * monitor pattern.
 */
class LocalServerDescriptor {
public:
  explicit LocalServerDescriptor(ServerDescriptor descriptor)
      : descriptor_(std::move(descriptor)) {}
  ~LocalServerDescriptor() = default;

  LocalServerDescriptor(const LocalServerDescriptor &) = delete;
  LocalServerDescriptor &operator=(const LocalServerDescriptor &) = delete;

  /**
   * @brief Copies the current descriptor
   * @return Consistent copy taken under the read lock
   */
  ServerDescriptor snapshot() const;

  AttributeMap capabilities() const;

  /**
   * @brief Replaces the capabilities of the descriptor
   * @param capabilities New capability map
   */
  void setCapabilities(AttributeMap capabilities);

  void setMetadata(AttributeMap metadata);

private:
  mutable std::shared_mutex mutex_;
  ServerDescriptor descriptor_;
};

} // namespace mcpd
