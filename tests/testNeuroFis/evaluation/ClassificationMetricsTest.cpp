/**
 * @file ClassificationMetricsTest.cpp
 * @author M. Reiter
 * @date 26.09.2026
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "NeuroFisTestBase.h"
#include "neurofis/evaluation/ClassificationMetrics.h"
#include "neurofis/utils/ExceptionHandler.h"

using namespace neurofis;
using evaluation::ClassificationMetrics;
using ::testing::ElementsAre;
using NeuroFisException = utils::ExceptionHandler::NeuroFisException;

class ClassificationMetricsTest : public NeuroFisTestBase {};

TEST_F(ClassificationMetricsTest, testPerfectPrediction) {
  const ClassificationMetrics metrics({2, 0, 1, 0}, {2, 0, 1, 0});

  EXPECT_THAT(metrics.getLabels(), ElementsAre(0, 1, 2));
  EXPECT_DOUBLE_EQ(metrics.getAccuracy(), 1.);
  EXPECT_DOUBLE_EQ(metrics.getPrecision(), 1.);
  EXPECT_DOUBLE_EQ(metrics.getRecall(), 1.);

  Eigen::MatrixXi expected(3, 3);
  expected << 2, 0, 0, 0, 1, 0, 0, 0, 1;
  EXPECT_EQ(metrics.getConfusionMatrix(), expected);
}

TEST_F(ClassificationMetricsTest, testWithUnclassified) {
  const ClassificationMetrics metrics({0, 0, 1, 1, 2}, {0, 1, 1, noClass, 2});

  EXPECT_EQ(metrics.getNumObservations(), 5ul);
  EXPECT_THAT(metrics.getLabels(), ElementsAre(noClass, 0, 1, 2));
  EXPECT_DOUBLE_EQ(metrics.getAccuracy(), .6);
  // unclassified observations do not count as predictions
  EXPECT_DOUBLE_EQ(metrics.getPrecision(), .75);
  EXPECT_DOUBLE_EQ(metrics.getRecall(), .6);

  const auto &confusion = metrics.getConfusionMatrix();
  EXPECT_EQ(confusion.sum(), 5);
  EXPECT_EQ(confusion(metrics.indexOf(0), metrics.indexOf(1)), 1);
  EXPECT_EQ(confusion(metrics.indexOf(1), metrics.indexOf(noClass)), 1);
  EXPECT_EQ(confusion(metrics.indexOf(2), metrics.indexOf(2)), 1);
  EXPECT_EQ(confusion.row(metrics.indexOf(noClass)).sum(), 0);
}

TEST_F(ClassificationMetricsTest, testNothingClassified) {
  const ClassificationMetrics metrics({0, 1}, {noClass, noClass});
  EXPECT_DOUBLE_EQ(metrics.getAccuracy(), 0.);
  EXPECT_DOUBLE_EQ(metrics.getPrecision(), 0.);
}

TEST_F(ClassificationMetricsTest, testInvalidInput) {
  EXPECT_THROW(ClassificationMetrics({0, 1}, {0}), NeuroFisException);
  EXPECT_THROW(ClassificationMetrics({}, {}), NeuroFisException);

  const ClassificationMetrics metrics({0, 1}, {0, 1});
  EXPECT_THROW(metrics.indexOf(7), NeuroFisException);
}

TEST_F(ClassificationMetricsTest, testToString) {
  const ClassificationMetrics metrics({0, 1, 1, 1}, {0, 1, 0, 1});
  const auto str = static_cast<std::string>(metrics);

  EXPECT_NE(str.find("Accuracy score  : 0.7500"), std::string::npos) << str;
  EXPECT_NE(str.find("Precision       : 0.7500"), std::string::npos) << str;
  EXPECT_NE(str.find("Recall          : 0.7500"), std::string::npos) << str;
  EXPECT_NE(str.find("Labels          : [0, 1]"), std::string::npos) << str;
}
