#include "mcp-discovery/announcement_broadcaster.hpp"
#include "mcp-discovery/discovery_error.hpp"
#include "mcp-discovery/discovery_packet.hpp"
#include "mcp-discovery/local_server_descriptor.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>

class AnnouncementBroadcasterTest : public ::testing::Test {
protected:
  AnnouncementBroadcasterTest() {
    options.port = 47811;
    options.announce_interval = std::chrono::milliseconds(100);
  }

  static mcpd::ServerDescriptor createDescriptor() {
    mcpd::ServerDescriptor descriptor;
    descriptor.name = "test-server";
    descriptor.version = "1.0.0";
    descriptor.host = "localhost";
    descriptor.port = 8080;
    return descriptor;
  }

  std::shared_ptr<mcpd::LocalServerDescriptor> descriptor_ref =
      std::make_shared<mcpd::LocalServerDescriptor>(createDescriptor());
  mcpd::DiscoveryOptions options;
};

TEST_F(AnnouncementBroadcasterTest, CanBeInstantiated) {
  EXPECT_NO_THROW(
      { mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options); });
}

TEST_F(AnnouncementBroadcasterTest, CannotBeCopied) {
  EXPECT_FALSE(std::is_copy_constructible_v<mcpd::AnnouncementBroadcaster>);
  EXPECT_FALSE(std::is_copy_assignable_v<mcpd::AnnouncementBroadcaster>);
}

TEST_F(AnnouncementBroadcasterTest, StartsIdle) {
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);

  EXPECT_EQ(broadcaster.state(), mcpd::AnnouncementBroadcaster::State::Idle);
  EXPECT_FALSE(broadcaster.isRunning());
}

TEST_F(AnnouncementBroadcasterTest, StopWithoutStartIsNoop) {
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);

  EXPECT_NO_THROW(broadcaster.stop());
  EXPECT_NO_THROW(broadcaster.stop());
  EXPECT_NO_THROW(broadcaster.wait());
  EXPECT_EQ(broadcaster.state(), mcpd::AnnouncementBroadcaster::State::Idle);
}

TEST_F(AnnouncementBroadcasterTest, AnnouncementCarriesDescriptor) {
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);

  auto decoded = mcpd::decodeDescriptor(broadcaster.createAnnouncement());

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, createDescriptor());
}

TEST_F(AnnouncementBroadcasterTest, AnnouncementFollowsSharedDescriptor) {
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);
  mcpd::AttributeMap capabilities = {
      {"tools", nlohmann::json::array({"tool1", "tool2"})},
      {"resources", nlohmann::json::array({"resource1"})}};

  descriptor_ref->setCapabilities(capabilities);
  auto decoded = mcpd::decodeDescriptor(broadcaster.createAnnouncement());

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->capabilities, capabilities);
}

TEST_F(AnnouncementBroadcasterTest, SendWithoutSocketIsLoggedAndSwallowed) {
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);

  testing::internal::CaptureStderr();
  bool sent = true;
  EXPECT_NO_THROW(sent = broadcaster.sendOnce());
  std::string log = testing::internal::GetCapturedStderr();

  EXPECT_FALSE(sent);
  EXPECT_EQ(broadcaster.failedCount(), 1u);
  EXPECT_NE(log.find("[ERROR]"), std::string::npos);
}

TEST_F(AnnouncementBroadcasterTest, RejectedSendIsLoggedAndCounted) {
  // Broadcast destination without SO_BROADCAST: sendto fails with EACCES
  options.group = "255.255.255.255";
  options.announce_interval = std::chrono::seconds(30);
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);

  testing::internal::CaptureStderr();
  try {
    broadcaster.start();
  } catch (const mcpd::SocketError &e) {
    testing::internal::GetCapturedStderr();
    GTEST_SKIP() << e.what();
  }
  bool sent = true;
  EXPECT_NO_THROW(sent = broadcaster.sendOnce());
  broadcaster.stop();
  broadcaster.wait();
  std::string log = testing::internal::GetCapturedStderr();

  EXPECT_FALSE(sent);
  EXPECT_EQ(broadcaster.sentCount(), 0u);
  EXPECT_GE(broadcaster.failedCount(), 1u);
  EXPECT_NE(log.find("Failed to send announcement to 255.255.255.255"),
            std::string::npos);
}

TEST_F(AnnouncementBroadcasterTest, UnencodableDescriptorIsLoggedAndCounted) {
  options.announce_interval = std::chrono::seconds(30);
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);
  try {
    broadcaster.start();
  } catch (const mcpd::SocketError &e) {
    GTEST_SKIP() << e.what();
  }
  descriptor_ref->setMetadata(
      {{"load", std::numeric_limits<double>::infinity()}});

  testing::internal::CaptureStderr();
  bool sent = true;
  EXPECT_NO_THROW(sent = broadcaster.sendOnce());
  std::string log = testing::internal::GetCapturedStderr();
  broadcaster.stop();
  broadcaster.wait();

  EXPECT_FALSE(sent);
  EXPECT_NE(log.find("Failed to encode announcement"), std::string::npos);
}

TEST_F(AnnouncementBroadcasterTest, NonPositiveIntervalIsRejected) {
  options.announce_interval = std::chrono::milliseconds(0);
  mcpd::AnnouncementBroadcaster zero(descriptor_ref, options);
  options.announce_interval = std::chrono::milliseconds(-5);
  mcpd::AnnouncementBroadcaster negative(descriptor_ref, options);

  EXPECT_THROW(zero.start(), mcpd::DiscoveryError);
  EXPECT_THROW(negative.start(), mcpd::DiscoveryError);
  EXPECT_EQ(zero.state(), mcpd::AnnouncementBroadcaster::State::Idle);
  EXPECT_EQ(zero.sentCount() + zero.failedCount(), 0u);
}

TEST_F(AnnouncementBroadcasterTest, StopDoesNotWaitForJoiningThread) {
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);
  try {
    broadcaster.start();
  } catch (const mcpd::SocketError &e) {
    GTEST_SKIP() << e.what();
  }

  std::thread stopper([&broadcaster]() {
    for (int i = 0; i < 1000; ++i) {
      broadcaster.stop();
    }
  });
  broadcaster.stop();
  broadcaster.wait();
  stopper.join();

  EXPECT_EQ(broadcaster.state(), mcpd::AnnouncementBroadcaster::State::Idle);
}

TEST_F(AnnouncementBroadcasterTest, InvalidGroupFailsToStart) {
  options.group = "not-a-group";
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);

  EXPECT_THROW(broadcaster.start(), mcpd::SocketError);
  EXPECT_EQ(broadcaster.state(), mcpd::AnnouncementBroadcaster::State::Idle);
}

TEST_F(AnnouncementBroadcasterTest, AnnouncesImmediatelyAndPeriodically) {
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);

  try {
    broadcaster.start();
  } catch (const mcpd::SocketError &e) {
    GTEST_SKIP() << e.what();
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(250));
  broadcaster.stop();
  broadcaster.wait();

  // Send failures (no multicast route) still count as attempts
  EXPECT_GE(broadcaster.sentCount() + broadcaster.failedCount(), 2u);
}

TEST_F(AnnouncementBroadcasterTest, StartTwiceIsIdempotent) {
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);

  try {
    broadcaster.start();
  } catch (const mcpd::SocketError &e) {
    GTEST_SKIP() << e.what();
  }
  EXPECT_NO_THROW(broadcaster.start());
  EXPECT_TRUE(broadcaster.isRunning());

  broadcaster.stop();
  broadcaster.stop();
  EXPECT_EQ(broadcaster.state(),
            mcpd::AnnouncementBroadcaster::State::Stopping);
  broadcaster.wait();
  EXPECT_EQ(broadcaster.state(), mcpd::AnnouncementBroadcaster::State::Idle);
}

TEST_F(AnnouncementBroadcasterTest, StopInterruptsLongInterval) {
  options.announce_interval = std::chrono::seconds(30);
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);

  try {
    broadcaster.start();
  } catch (const mcpd::SocketError &e) {
    GTEST_SKIP() << e.what();
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  auto begin = std::chrono::steady_clock::now();
  broadcaster.stop();
  broadcaster.wait();
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, std::chrono::seconds(1));
}

TEST_F(AnnouncementBroadcasterTest, CanBeRestarted) {
  mcpd::AnnouncementBroadcaster broadcaster(descriptor_ref, options);

  try {
    broadcaster.start();
  } catch (const mcpd::SocketError &e) {
    GTEST_SKIP() << e.what();
  }
  broadcaster.stop();
  broadcaster.start();
  EXPECT_TRUE(broadcaster.isRunning());
  broadcaster.stop();
  broadcaster.wait();
  EXPECT_FALSE(broadcaster.isRunning());
}
