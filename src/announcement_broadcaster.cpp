#include "mcp-discovery/announcement_broadcaster.hpp"
#include "mcp-discovery/discovery_error.hpp"
#include "mcp-discovery/discovery_packet.hpp"
#include "mcp-discovery/logger.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace mcpd {

AnnouncementBroadcaster::AnnouncementBroadcaster(
    std::shared_ptr<LocalServerDescriptor> descriptor,
    const DiscoveryOptions &options)
    : descriptor_(std::move(descriptor)), options_(options) {
  std::memset(&this->group_address_, 0, sizeof(this->group_address_));
};

AnnouncementBroadcaster::~AnnouncementBroadcaster() {
  this->stop();
  this->wait();
};

void AnnouncementBroadcaster::initializeSocket_() {
  this->group_address_.sin_family = AF_INET;
  this->group_address_.sin_port = htons(this->options_.port);
  if (inet_pton(AF_INET, this->options_.group.c_str(),
                &this->group_address_.sin_addr) != 1) {
    throw SocketError("Invalid multicast group '" + this->options_.group + "'",
                      EINVAL);
  }

  struct in_addr interface_address;
  if (inet_pton(AF_INET, this->options_.interface_address.c_str(),
                &interface_address) != 1) {
    throw SocketError("Invalid interface address '" +
                          this->options_.interface_address + "'",
                      EINVAL);
  }

  int fd = socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    throw SocketError("Failed to create socket", errno);
  }

  unsigned char ttl = static_cast<unsigned char>(this->options_.ttl);
  if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
    int error = errno;
    close(fd);
    throw SocketError("Failed to set multicast TTL", error);
  }

  unsigned char loopback = this->options_.loopback ? 1 : 0;
  if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loopback,
                 sizeof(loopback)) < 0) {
    int error = errno;
    close(fd);
    throw SocketError("Failed to set multicast loopback", error);
  }

  if (interface_address.s_addr != htonl(INADDR_ANY) &&
      setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &interface_address,
                 sizeof(interface_address)) < 0) {
    int error = errno;
    close(fd);
    throw SocketError("Failed to set multicast interface", error);
  }

  this->socket_ = fd;
};

void AnnouncementBroadcaster::closeSocket_() {
  int fd = this->socket_.exchange(-1);
  if (fd >= 0) {
    close(fd);
  }
};

std::vector<uint8_t> AnnouncementBroadcaster::createAnnouncement() const {
  return encodePacket(this->descriptor_->snapshot());
};

bool AnnouncementBroadcaster::sendOnce() {
  int fd = this->socket_.load();
  if (fd < 0) {
    Logger::log(LogLevel::ERROR,
                "Cannot announce: broadcaster socket is not open");
    this->failed_count_++;
    return false;
  }

  std::vector<uint8_t> buffer;
  try {
    buffer = this->createAnnouncement();
  } catch (const DiscoveryError &e) {
    Logger::log(LogLevel::ERROR,
                "Failed to encode announcement: " + std::string(e.what()));
    this->failed_count_++;
    return false;
  }

  if (sendto(fd, buffer.data(), buffer.size(), 0,
             (struct sockaddr *)&this->group_address_,
             sizeof(this->group_address_)) == -1) {
    Logger::log(LogLevel::ERROR, "Failed to send announcement to " +
                                     this->options_.group + ":" +
                                     std::to_string(this->options_.port) +
                                     ": " + std::string(strerror(errno)));
    this->failed_count_++;
    return false;
  }

  this->sent_count_++;
  return true;
};

void AnnouncementBroadcaster::run_() {
  while (!this->stop_requested_) {
    try {
      this->sendOnce();
    } catch (const std::exception &e) {
      Logger::log(LogLevel::ERROR,
                  "Announcement error: " + std::string(e.what()));
    }

    std::unique_lock lock(this->wake_mutex_);
    this->wake_.wait_for(lock, this->options_.announce_interval,
                         [this]() { return this->stop_requested_.load(); });
  }
};

void AnnouncementBroadcaster::start() {
  std::lock_guard lock(this->lifecycle_mutex_);
  if (this->state_ == State::Running) {
    return;
  }
  if (this->options_.announce_interval <= std::chrono::milliseconds::zero()) {
    throw DiscoveryError(
        "Announce interval must be positive, got " +
        std::to_string(this->options_.announce_interval.count()) + " ms");
  }
  if (this->state_ == State::Stopping) {
    if (this->worker_.joinable()) {
      this->worker_.join();
    }
    this->closeSocket_();
    this->state_ = State::Idle;
  }

  this->initializeSocket_();
  this->stop_requested_ = false;
  this->worker_ = std::thread(&AnnouncementBroadcaster::run_, this);
  this->state_ = State::Running;
  Logger::log(LogLevel::INFO,
              "Announcing '" + this->descriptor_->snapshot().name + "' to " +
                  this->options_.group + ":" +
                  std::to_string(this->options_.port));
};

// Does not take lifecycle_mutex_, which wait() holds while joining
void AnnouncementBroadcaster::stop() {
  State expected = State::Running;
  if (!this->state_.compare_exchange_strong(expected, State::Stopping)) {
    return;
  }
  {
    std::lock_guard wake_lock(this->wake_mutex_);
    this->stop_requested_ = true;
  }
  this->wake_.notify_all();
};

void AnnouncementBroadcaster::wait() {
  std::lock_guard lock(this->lifecycle_mutex_);
  if (this->state_ == State::Running) {
    return;
  }
  if (this->worker_.joinable()) {
    this->worker_.join();
  }
  this->closeSocket_();
  this->state_ = State::Idle;
};

AnnouncementBroadcaster::State AnnouncementBroadcaster::state() const {
  return this->state_.load();
};

} // namespace mcpd
