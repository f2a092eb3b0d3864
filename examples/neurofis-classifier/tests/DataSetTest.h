/**
 * @file DataSetTest.h
 * @author M. Reiter
 * @date 28.09.2026
 */

#pragma once

#include <gtest/gtest.h>

#include <string>

#include "NeuroFisTestBase.h"

class DataSetTest : public NeuroFisTestBase {
 protected:
  static std::string csvFile(const std::string &name) { return std::string(CSVDIRECTORY) + name; }
};
