#include "mcp-discovery/passive_scan.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <string>

TEST(PassiveScanTest, StartFailureReturnsEmptyAndLogs) {
  mcpd::DiscoveryOptions options;
  options.group = "not.a.group";

  testing::internal::CaptureStderr();
  auto servers =
      mcpd::discoverServers(std::chrono::milliseconds(100), options);
  std::string log = testing::internal::GetCapturedStderr();

  EXPECT_TRUE(servers.empty());
  EXPECT_NE(log.find("[ERROR]"), std::string::npos);
  EXPECT_NE(log.find("Server discovery failed"), std::string::npos);
}

TEST(PassiveScanTest, QuietGroupReturnsEmpty) {
  mcpd::DiscoveryOptions options;
  options.port = 47851;
  options.receive_timeout = std::chrono::milliseconds(50);

  auto begin = std::chrono::steady_clock::now();
  auto servers =
      mcpd::discoverServers(std::chrono::milliseconds(300), options);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_TRUE(servers.empty());
  EXPECT_LT(elapsed, std::chrono::seconds(2));
}
