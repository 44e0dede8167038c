#pragma once

#include "constants.hpp"
#include "discovery_options.hpp"
#include "remote_server_registry.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mcpd {

class AnnouncementListener {
public:
  enum class State { Idle, Running, Stopping };

  explicit AnnouncementListener(
      const DiscoveryOptions &options = DiscoveryOptions());

  AnnouncementListener(std::shared_ptr<RemoteServerRegistry> registry,
                       const DiscoveryOptions &options = DiscoveryOptions());

  ~AnnouncementListener();

  AnnouncementListener(const AnnouncementListener &) = delete;
  AnnouncementListener &operator=(const AnnouncementListener &) = delete;

  /**
   * @throws SocketError if the group cannot be joined
   */
  void start();
  void stop();
  void wait();

  /**
   * @brief Performs one receive bounded by the receive timeout
   * @return true if a valid announcement was recorded
   */
  bool receiveOnce();

  /**
   * @brief Decodes one datagram and records it in the registry
   * @return false if the datagram was discarded
   */
  bool processDatagram(const uint8_t *data, size_t size);
  bool processDatagram(const std::vector<uint8_t> &datagram);

  std::vector<ServerDescriptor> getLiveDescriptors() const;

  std::shared_ptr<RemoteServerRegistry> registry() const { return registry_; }

  State state() const;
  bool isRunning() const { return this->state() == State::Running; }

  uint64_t acceptedCount() const { return accepted_count_.load(); }
  uint64_t discardedCount() const { return discarded_count_.load(); }

private:
  void initializeSocket_();

  void closeSocket_();

  // buffer must hold MAX_DATAGRAM_SIZE bytes
  bool receiveInto_(std::vector<uint8_t> &buffer);

  void run_();

  std::shared_ptr<RemoteServerRegistry> registry_;
  DiscoveryOptions options_;
  std::atomic<int> socket_{-1};

  std::mutex lifecycle_mutex_;
  std::atomic<State> state_{State::Idle};
  std::thread worker_;
  std::atomic<bool> stop_requested_{false};

  std::atomic<uint64_t> accepted_count_{0};
  std::atomic<uint64_t> discarded_count_{0};

  static constexpr size_t MAX_DATAGRAM_SIZE =
      constants::packet::MAX_DATAGRAM_SIZE;
};

} // namespace mcpd
