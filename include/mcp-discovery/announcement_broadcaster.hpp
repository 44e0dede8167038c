#pragma once

#include "discovery_options.hpp"
#include "local_server_descriptor.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <vector>

namespace mcpd {

/**
 * @brief Periodically announces the local server to the multicast group
 *
 * The descriptor is read from the shared holder on every tick, so updates
 * made through LocalServerDescriptor are carried by the next announcement.
 */
class AnnouncementBroadcaster {
public:
  enum class State { Idle, Running, Stopping };

  explicit AnnouncementBroadcaster(
      std::shared_ptr<LocalServerDescriptor> descriptor,
      const DiscoveryOptions &options = DiscoveryOptions());

  ~AnnouncementBroadcaster();

  // Delete copy and move operations
  AnnouncementBroadcaster(const AnnouncementBroadcaster &) = delete;
  AnnouncementBroadcaster &operator=(const AnnouncementBroadcaster &) = delete;

  /**
   * @brief Opens the socket and spawns the announce loop
   *
   * The first announcement is sent immediately, then one per interval.
   * Calling start() while running is a no-op.
   *
   * @throws DiscoveryError if the announce interval is not positive
   * @throws SocketError if the socket cannot be created or configured
   */
  void start();

  /**
   * @brief Requests the announce loop to exit
   *
   * Does not block, even while another thread is inside wait(). The loop
   * observes the request at once. Safe to call when not running.
   */
  void stop();

  /**
   * @brief Waits for a stopped loop to exit and releases the socket
   *
   * Has no effect while running; call stop() first.
   */
  void wait();

  /**
   * @brief Sends one announcement
   * @return true if the datagram was handed to the kernel, false if the send
   * failed (the failure is logged)
   */
  bool sendOnce();

  /**
   * @brief Encodes the announcement the next sendOnce() would send
   */
  std::vector<uint8_t> createAnnouncement() const;

  State state() const;
  bool isRunning() const { return this->state() == State::Running; }

  uint64_t sentCount() const { return sent_count_.load(); }
  uint64_t failedCount() const { return failed_count_.load(); }

private:
  void initializeSocket_();

  void closeSocket_();

  void run_();

  std::shared_ptr<LocalServerDescriptor> descriptor_;
  DiscoveryOptions options_;
  std::atomic<int> socket_{-1};
  struct sockaddr_in group_address_;

  std::mutex lifecycle_mutex_;
  std::atomic<State> state_{State::Idle};
  std::thread worker_;

  std::mutex wake_mutex_;
  std::condition_variable wake_;
  std::atomic<bool> stop_requested_{false};

  std::atomic<uint64_t> sent_count_{0};
  std::atomic<uint64_t> failed_count_{0};
};

} // namespace mcpd
