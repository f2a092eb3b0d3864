/**
 * @file NeuroFisTest.h
 * @author M. Reiter
 * @date 27.09.2026
 */

#pragma once

#include <gtest/gtest.h>

#include <sstream>

#include "NeuroFisTestBase.h"
#include "neurofis/DataTypes.h"

class NeuroFisTest : public NeuroFisTestBase {
 protected:
  const neurofis::FeatureMatrix _data{Eigen::VectorXd::LinSpaced(7, 0., 6.)};
  const neurofis::LabelVector _labels{0, 0, 0, 1, 1, 1, 1};

  /**
   * Receives the log output of the classifiers created in a test.
   */
  std::stringstream _logStream;
};
