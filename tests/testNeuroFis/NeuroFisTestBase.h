/**
 * @file NeuroFisTestBase.h
 * @author seckler
 * @date 24.04.18
 */

#pragma once

#include <gtest/gtest.h>

#include "neurofis/utils/logging/Logger.h"

/**
 * Base fixture that provides a registered logger for the duration of a test.
 */
class NeuroFisTestBase : public testing::Test {
 public:
  NeuroFisTestBase() { neurofis::Logger::create(); }

  ~NeuroFisTestBase() override { neurofis::Logger::unregister(); }
};
