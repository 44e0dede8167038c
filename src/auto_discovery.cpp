#include "mcp-discovery/auto_discovery.hpp"
#include "mcp-discovery/logger.hpp"
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcpd {

AutoDiscovery::AutoDiscovery(ServerDescriptor descriptor, bool enabled,
                             const DiscoveryOptions &options)
    : descriptor_(
          std::make_shared<LocalServerDescriptor>(std::move(descriptor))),
      enabled_(enabled), options_(options) {};

AutoDiscovery::~AutoDiscovery() { this->stop(); };

void AutoDiscovery::start() {
  if (!this->enabled_) {
    Logger::log(LogLevel::INFO, "Auto-discovery is disabled");
    return;
  }

  std::lock_guard lock(this->mutex_);
  if (this->broadcaster_) {
    return;
  }

  auto broadcaster = std::make_unique<AnnouncementBroadcaster>(
      this->descriptor_, this->options_);
  broadcaster->start();

  std::unique_ptr<AnnouncementListener> listener;
  if (this->options_.listen) {
    listener = std::make_unique<AnnouncementListener>(this->options_);
    try {
      listener->start();
    } catch (const std::exception &e) {
      Logger::log(LogLevel::ERROR, "Failed to start discovery listener: " +
                                       std::string(e.what()));
      broadcaster->stop();
      broadcaster->wait();
      throw;
    }
  }

  this->broadcaster_ = std::move(broadcaster);
  this->listener_ = std::move(listener);
};

void AutoDiscovery::stop() {
  std::lock_guard lock(this->mutex_);
  if (this->broadcaster_) {
    this->broadcaster_->stop();
  }
  if (this->listener_) {
    this->listener_->stop();
  }
  if (this->broadcaster_) {
    this->broadcaster_->wait();
    this->broadcaster_.reset();
  }
  if (this->listener_) {
    this->listener_->wait();
    this->listener_.reset();
  }
};

void AutoDiscovery::updateCapabilities(AttributeMap capabilities) {
  this->descriptor_->setCapabilities(std::move(capabilities));
};

void AutoDiscovery::updateMetadata(AttributeMap metadata) {
  this->descriptor_->setMetadata(std::move(metadata));
};

ServerDescriptor AutoDiscovery::serverDescriptor() const {
  return this->descriptor_->snapshot();
};

std::vector<ServerDescriptor> AutoDiscovery::getLiveDescriptors() const {
  std::lock_guard lock(this->mutex_);
  if (!this->listener_) {
    return {};
  }
  return this->listener_->getLiveDescriptors();
};

bool AutoDiscovery::isBroadcasting() const {
  std::lock_guard lock(this->mutex_);
  return this->broadcaster_ && this->broadcaster_->isRunning();
};

bool AutoDiscovery::isListening() const {
  std::lock_guard lock(this->mutex_);
  return this->listener_ && this->listener_->isRunning();
};

const AnnouncementBroadcaster *AutoDiscovery::broadcaster() const {
  std::lock_guard lock(this->mutex_);
  return this->broadcaster_.get();
};

} // namespace mcpd
