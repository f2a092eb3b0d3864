/**
 * @file LoggerTest.h
 * @author seckler
 * @date 16.04.18
 */

#pragma once

#include <gtest/gtest.h>

#include <sstream>

#include "neurofis/utils/logging/Logger.h"

class LoggerTest : public testing::Test {
 public:
  void SetUp() override;

  void TearDown() override;

  /**
   * Logs one message per level and counts the lines that were written.
   * @param level
   * @param enabled If false the logger is switched off after setting the level.
   * @return Number of written lines.
   */
  int testLevel(neurofis::Logger::LogLevel level, bool enabled = true);

 protected:
  std::stringstream stream;
};
