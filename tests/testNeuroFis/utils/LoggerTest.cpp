/**
 * @file LoggerTest.cpp
 * @author seckler
 * @date 16.04.18
 */

#include "LoggerTest.h"

void LoggerTest::SetUp() { neurofis::Logger::create(stream); }

void LoggerTest::TearDown() { neurofis::Logger::unregister(); }

int LoggerTest::testLevel(neurofis::Logger::LogLevel level, bool enabled) {
  neurofis::Logger::get()->set_level(level);
  if (not enabled) neurofis::Logger::get()->set_level(spdlog::level::off);

  stream.str("");
  stream.clear();

  neurofis::Logger::get()->trace("trace");
  neurofis::Logger::get()->debug("debug");
  neurofis::Logger::get()->info("info");
  neurofis::Logger::get()->warn("warn");
  neurofis::Logger::get()->error("error");
  neurofis::Logger::get()->critical("critical");
  neurofis::Logger::get()->flush();

  int lineCount = 0;
  std::string str;
  while (getline(stream, str)) ++lineCount;

  return lineCount;
}

TEST_F(LoggerTest, LogLevelTest) {
  EXPECT_EQ(testLevel(spdlog::level::trace), 6);
  EXPECT_EQ(testLevel(spdlog::level::debug), 5);
  EXPECT_EQ(testLevel(spdlog::level::info), 4);
  EXPECT_EQ(testLevel(spdlog::level::warn), 3);
  EXPECT_EQ(testLevel(spdlog::level::err), 2);
  EXPECT_EQ(testLevel(spdlog::level::critical), 1);
  EXPECT_EQ(testLevel(spdlog::level::off), 0);
}

TEST_F(LoggerTest, LogLevelTestDisabled) {
  EXPECT_EQ(testLevel(spdlog::level::trace, false), 0);
  EXPECT_EQ(testLevel(spdlog::level::info, false), 0);
  EXPECT_EQ(testLevel(spdlog::level::critical, false), 0);
}

TEST_F(LoggerTest, RecreateReplacesLogger) {
  std::stringstream otherStream;
  neurofis::Logger::create(otherStream);
  ASSERT_NE(neurofis::Logger::get(), nullptr);
  neurofis::Logger::get()->warn("to the other stream");
  neurofis::Logger::get()->flush();

  EXPECT_TRUE(stream.str().empty());
  EXPECT_NE(otherStream.str().find("to the other stream"), std::string::npos);
}

TEST_F(LoggerTest, UnregisterRemovesLogger) {
  neurofis::Logger::unregister();
  EXPECT_EQ(neurofis::Logger::get(), nullptr);
}

TEST_F(LoggerTest, FlushLevel) {
  EXPECT_EQ(neurofis::Logger::get()->flush_level(), spdlog::level::warn);
  neurofis::Logger::create(stream, spdlog::level::err);
  EXPECT_EQ(neurofis::Logger::get()->flush_level(), spdlog::level::err);
}
