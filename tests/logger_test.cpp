#include "mcp-discovery/logger.hpp"
#include <gtest/gtest.h>
#include <string>

class LoggerTest : public ::testing::Test {
protected:
  void TearDown() override {
    mcpd::Logger::setTag("");
    mcpd::Logger::setMinLevel(mcpd::LogLevel::INFO);
  }
};

TEST_F(LoggerTest, WritesLevelTagAndMessage) {
  mcpd::Logger::setTag("weather");

  testing::internal::CaptureStderr();
  mcpd::Logger::log(mcpd::LogLevel::WARNING, "socket closed");
  std::string output = testing::internal::GetCapturedStderr();

  EXPECT_NE(output.find("[WARNING] weather: socket closed"),
            std::string::npos);
}

TEST_F(LoggerTest, OmitsEmptyTag) {
  testing::internal::CaptureStderr();
  mcpd::Logger::log(mcpd::LogLevel::INFO, "ready");
  std::string output = testing::internal::GetCapturedStderr();

  EXPECT_NE(output.find("[INFO] ready"), std::string::npos);
}

TEST_F(LoggerTest, DropsMessagesBelowMinimumLevel) {
  mcpd::Logger::setMinLevel(mcpd::LogLevel::ERROR);

  testing::internal::CaptureStderr();
  mcpd::Logger::log(mcpd::LogLevel::INFO, "hidden");
  mcpd::Logger::log(mcpd::LogLevel::ERROR, "shown");
  std::string output = testing::internal::GetCapturedStderr();

  EXPECT_EQ(output.find("hidden"), std::string::npos);
  EXPECT_NE(output.find("[ERROR] shown"), std::string::npos);
}
