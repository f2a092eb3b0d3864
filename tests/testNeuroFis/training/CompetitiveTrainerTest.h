/**
 * @file CompetitiveTrainerTest.h
 * @author M. Reiter
 * @date 26.09.2026
 */

#pragma once

#include <gtest/gtest.h>

#include "NeuroFisTestBase.h"
#include "neurofis/rules/RuleSet.h"

class CompetitiveTrainerTest : public NeuroFisTestBase {
 protected:
  /**
   * One feature partitioned on [0, 6] with the rules mf1 -> class 0 and mf3 -> class 1.
   * @return
   */
  static neurofis::rules::RuleSet makeRuleSet();

  /**
   * Active membership functions of all features, as the trainer caches them.
   */
  static std::vector<std::vector<size_t>> activeFunctions(const neurofis::rules::RuleSet &ruleSet);

  static std::vector<double> positions(const neurofis::rules::RuleSet &ruleSet);
};
