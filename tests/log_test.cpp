#include "ksuid/util/log.hpp"

#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace ksuid;

TEST(LogTest, ParseLevelNames) {
  EXPECT_EQ(log::parse_level("trace"), log::Level::Trace);
  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("info"), log::Level::Info);
  EXPECT_EQ(log::parse_level("warn"), log::Level::Warn);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
  EXPECT_FALSE(log::parse_level("WARNING").has_value());
  EXPECT_FALSE(log::parse_level("").has_value());
}

TEST(LogTest, UnknownNameFallsBackToInfo) {
  log::set_level("verbose");
  EXPECT_EQ(log::logger().level(), log::Level::Info);
  log::set_level(log::Level::Error);
}

TEST(LogTest, FileOutputFiltersByLevel) {
  const auto path = std::filesystem::temp_directory_path() / "ksuid_log_test.log";
  std::filesystem::remove(path);

  log::Logger logger;
  ASSERT_TRUE(logger.set_output_file(path.string()));
  logger.set_level(log::Level::Warn);
  logger.log(log::Level::Debug, "hidden {}", 1);
  logger.log(log::Level::Error, "visible {}", 2);

  logger.start();
  EXPECT_FALSE(logger.set_output_file(path.string()));
  logger.log(log::Level::Warn, "queued {}", 3);
  logger.stop();
  ASSERT_TRUE(logger.set_output_file(""));

  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  const auto text = ss.str();
  std::filesystem::remove(path);

  EXPECT_EQ(text.find("hidden 1"), std::string::npos);
  EXPECT_NE(text.find("visible 2"), std::string::npos);
  EXPECT_NE(text.find("error"), std::string::npos);
  EXPECT_NE(text.find("queued 3"), std::string::npos);
  EXPECT_EQ(logger.dropped_messages(), 0u);
}
