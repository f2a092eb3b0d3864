/**
 * @file TieBreakOptionTest.cpp
 * @author M. Reiter
 * @date 23.09.2026
 */

#include <gtest/gtest.h>

#include <sstream>

#include "NeuroFisTestBase.h"
#include "neurofis/options/TieBreakOption.h"
#include "neurofis/utils/ExceptionHandler.h"

class TieBreakOptionTest : public NeuroFisTestBase {};

TEST_F(TieBreakOptionTest, toStringAndParseAreInverse) {
  for (const auto &option : neurofis::TieBreakOption::getAllOptions()) {
    EXPECT_EQ(neurofis::TieBreakOption::parseOptionExact(option.to_string()), option);
  }
  EXPECT_EQ(neurofis::TieBreakOption::getAllOptions().size(), 2ul);
}

TEST_F(TieBreakOptionTest, streamOperator) {
  std::stringstream stream;
  stream << neurofis::TieBreakOption(neurofis::TieBreakOption::lastMaximum);
  EXPECT_EQ(stream.str(), "lastMaximum");
}

TEST_F(TieBreakOptionTest, parseUnknownThrows) {
  EXPECT_THROW(neurofis::TieBreakOption::parseOptionExact("middleMaximum"),
               neurofis::utils::ExceptionHandler::NeuroFisException);
}
