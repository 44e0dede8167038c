#include "mcp-discovery/announcement_listener.hpp"
#include "mcp-discovery/discovery_error.hpp"
#include "mcp-discovery/discovery_packet.hpp"
#include "mcp-discovery/logger.hpp"
#include <algorithm>
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
#include <sys/time.h>
#include <unistd.h>
#include <vector>

namespace mcpd {

AnnouncementListener::AnnouncementListener(const DiscoveryOptions &options)
    : AnnouncementListener(
          std::make_shared<RemoteServerRegistry>(options.eviction_timeout),
          options) {};

AnnouncementListener::AnnouncementListener(
    std::shared_ptr<RemoteServerRegistry> registry,
    const DiscoveryOptions &options)
    : registry_(std::move(registry)), options_(options) {};

AnnouncementListener::~AnnouncementListener() {
  this->stop();
  this->wait();
};

void AnnouncementListener::initializeSocket_() {
  struct ip_mreq membership;
  std::memset(&membership, 0, sizeof(membership));
  if (inet_pton(AF_INET, this->options_.group.c_str(),
                &membership.imr_multiaddr) != 1) {
    throw SocketError("Invalid multicast group '" + this->options_.group + "'",
                      EINVAL);
  }
  if (inet_pton(AF_INET, this->options_.interface_address.c_str(),
                &membership.imr_interface) != 1) {
    throw SocketError("Invalid interface address '" +
                          this->options_.interface_address + "'",
                      EINVAL);
  }

  int fd = socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    throw SocketError("Failed to create socket", errno);
  }

  // Several processes on one host listen to the same group and port
  int reuse = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    int error = errno;
    close(fd);
    throw SocketError("Failed to set SO_REUSEADDR", error);
  }
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0) {
    int error = errno;
    close(fd);
    throw SocketError("Failed to set SO_REUSEPORT", error);
  }

  // A zero SO_RCVTIMEO would block forever
  auto timeout_ms =
      std::max<long long>(this->options_.receive_timeout.count(), 1);
  struct timeval timeout;
  timeout.tv_sec = timeout_ms / 1000;
  timeout.tv_usec = (timeout_ms % 1000) * 1000;
  if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
    int error = errno;
    close(fd);
    throw SocketError("Failed to set socket timeout", error);
  }

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(this->options_.port);
  addr.sin_addr.s_addr = htonl(INADDR_ANY);

  if (bind(fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    int error = errno;
    close(fd);
    throw SocketError("Failed to bind port " +
                          std::to_string(this->options_.port),
                      error);
  }

  if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership,
                 sizeof(membership)) < 0) {
    int error = errno;
    close(fd);
    throw SocketError("Failed to join multicast group " + this->options_.group,
                      error);
  }

  this->socket_ = fd;
};

void AnnouncementListener::closeSocket_() {
  int fd = this->socket_.exchange(-1);
  if (fd >= 0) {
    close(fd);
  }
};

bool AnnouncementListener::processDatagram(const uint8_t *data, size_t size) {
  auto packet = decodePacket(data, size);
  if (!packet) {
    this->discarded_count_++;
    return false;
  }

  this->registry_->addOrUpdate(packet->descriptor,
                               std::chrono::system_clock::now());
  this->accepted_count_++;
  return true;
};

bool AnnouncementListener::processDatagram(
    const std::vector<uint8_t> &datagram) {
  return this->processDatagram(datagram.data(), datagram.size());
};

bool AnnouncementListener::receiveOnce() {
  std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
  return this->receiveInto_(buffer);
};

bool AnnouncementListener::receiveInto_(std::vector<uint8_t> &buffer) {
  int fd = this->socket_.load();
  if (fd < 0) {
    return false;
  }

  struct sockaddr_in sender_addr;
  socklen_t sender_addr_len = sizeof(sender_addr);

  ssize_t received =
      recvfrom(fd, buffer.data(), buffer.size(), 0,
               (struct sockaddr *)&sender_addr, &sender_addr_len);

  if (received < 0) {
    // A timeout only gives the loop a chance to observe stop()
    if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      Logger::log(LogLevel::WARNING,
                  "Failed to receive announcement: " +
                      std::string(strerror(errno)));
    }
    return false;
  }

  return this->processDatagram(buffer.data(), static_cast<size_t>(received));
};

void AnnouncementListener::run_() {
  std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
  while (!this->stop_requested_) {
    try {
      this->receiveInto_(buffer);
    } catch (const std::exception &e) {
      Logger::log(LogLevel::ERROR,
                  "Receiving announcement error: " + std::string(e.what()));
    }
  }
};

std::vector<ServerDescriptor>
AnnouncementListener::getLiveDescriptors() const {
  return this->registry_->getLiveDescriptors();
};

void AnnouncementListener::start() {
  std::lock_guard lock(this->lifecycle_mutex_);
  if (this->state_ == State::Running) {
    return;
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
  this->worker_ = std::thread(&AnnouncementListener::run_, this);
  this->state_ = State::Running;
  Logger::log(LogLevel::INFO, "Listening for announcements on " +
                                  this->options_.group + ":" +
                                  std::to_string(this->options_.port));
};

// Does not take lifecycle_mutex_, which wait() holds while joining
void AnnouncementListener::stop() {
  State expected = State::Running;
  if (this->state_.compare_exchange_strong(expected, State::Stopping)) {
    this->stop_requested_ = true;
  }
};

void AnnouncementListener::wait() {
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

AnnouncementListener::State AnnouncementListener::state() const {
  return this->state_.load();
};

} // namespace mcpd
