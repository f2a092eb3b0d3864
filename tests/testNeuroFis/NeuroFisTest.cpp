/**
 * @file NeuroFisTest.cpp
 * @author M. Reiter
 * @date 27.09.2026
 */

#include "NeuroFisTest.h"

#include <limits>

#include "mocks/MockTrainingObserver.h"
#include "neurofis/NeuroFis.h"
#include "neurofis/utils/ExceptionHandler.h"
#include "neurofis/utils/Math.h"

using namespace neurofis;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using NeuroFisException = utils::ExceptionHandler::NeuroFisException;

TEST_F(NeuroFisTest, testFitAndPredict) {
  NeuroFis neuroFis(10, 2, _logStream);
  const auto statistics = neuroFis.fit(_data, _labels, 10, .001);

  EXPECT_EQ(statistics.epochs, 10ul);
  EXPECT_EQ(neuroFis.getRuleSet().size(), 5ul);
  EXPECT_EQ(neuroFis.predict(utils::Math::makeVectorXd({.5})), 0);
  EXPECT_EQ(neuroFis.predict(utils::Math::makeVectorXd({5.5})), 1);

  const auto predictions = neuroFis.predict(utils::Math::makeMatrixXd({{.5}, {1.5}, {4.5}, {5.5}}));
  EXPECT_EQ(predictions, (LabelVector{0, 0, 1, 1}));
}

TEST_F(NeuroFisTest, testEndToEndWithoutTraining) {
  NeuroFis neuroFis(10, 2, _logStream);
  const auto statistics = neuroFis.fit(_data, _labels, 0, .001);

  EXPECT_EQ(statistics.epochs, 0ul);
  EXPECT_EQ(statistics.updates, 0ul);

  const auto &rules = neuroFis.getRuleSet().getRules();
  ASSERT_EQ(rules.count({0}), 1ul);
  EXPECT_EQ(rules.at({0}).classLabel, 0);
  ASSERT_EQ(rules.count({4}), 1ul);
  EXPECT_EQ(rules.at({4}).classLabel, 1);

  EXPECT_EQ(neuroFis.predict(utils::Math::makeVectorXd({.5})), 0);
  EXPECT_EQ(neuroFis.predict(utils::Math::makeVectorXd({5.5})), 1);
}

TEST_F(NeuroFisTest, testPhasesSeparately) {
  NeuroFis neuroFis(10, 3, _logStream);

  EXPECT_FALSE(neuroFis.isInduced());
  EXPECT_EQ(neuroFis.induce(_data, _labels), 3ul);
  EXPECT_TRUE(neuroFis.isInduced());
  // mf0, mf3 and mf4 survive, the gap between mf0 and mf3 gets closed
  EXPECT_EQ(neuroFis.repair(), 1ul);
  EXPECT_EQ(neuroFis.repair(), 0ul);
  const auto statistics = neuroFis.train(_data, _labels, 0, .1);
  EXPECT_EQ(statistics.epochs, 0ul);
  EXPECT_EQ(neuroFis.predict(utils::Math::makeVectorXd({1.5})), 0);
}

TEST_F(NeuroFisTest, testEvaluate) {
  NeuroFis neuroFis(10, 2, _logStream);
  neuroFis.fit(_data, _labels, 10, .001);

  const auto metrics = neuroFis.evaluate(_data, _labels);
  EXPECT_EQ(metrics.getNumObservations(), 7ul);
  EXPECT_GT(metrics.getAccuracy(), .8);
  EXPECT_LE(metrics.getAccuracy(), 1.);
}

TEST_F(NeuroFisTest, testNotInduced) {
  NeuroFis neuroFis(10, 5, _logStream);
  EXPECT_THROW(static_cast<void>(neuroFis.predict(utils::Math::makeVectorXd({1.}))), NeuroFisException);
  EXPECT_THROW(neuroFis.repair(), NeuroFisException);
  EXPECT_THROW(neuroFis.train(_data, _labels, 1, .1), NeuroFisException);
}

TEST_F(NeuroFisTest, testNoRulesPredictsNoClass) {
  NeuroFis neuroFis(10, 4, _logStream);
  const auto statistics = neuroFis.fit(_data, _labels, 5, .1);

  EXPECT_TRUE(neuroFis.getRuleSet().empty());
  EXPECT_EQ(statistics.updates, 0ul);
  EXPECT_EQ(neuroFis.predict(utils::Math::makeVectorXd({3.})), noClass);
  EXPECT_NE(_logStream.str().find("no rules"), std::string::npos) << _logStream.str();
}

TEST_F(NeuroFisTest, testMaxRulesOnlyWarns) {
  NeuroFis neuroFis(2, 2, _logStream);
  EXPECT_EQ(neuroFis.induce(_data, _labels), 5ul);
  EXPECT_NE(_logStream.str().find("more than maxRules (2)"), std::string::npos) << _logStream.str();
}

TEST_F(NeuroFisTest, testInvalidInput) {
  EXPECT_THROW(NeuroFis(10, 0, _logStream), NeuroFisException);

  NeuroFis neuroFis(10, 2, _logStream);
  EXPECT_THROW(neuroFis.fit(_data, {0, 1}, 1, .1), NeuroFisException);
  EXPECT_THROW(neuroFis.fit(_data, _labels, 1, -.1), NeuroFisException);
  // a failed fit leaves the classifier untouched
  EXPECT_FALSE(neuroFis.isInduced());

  neuroFis.fit(_data, _labels, 1, .1);
  EXPECT_THROW(static_cast<void>(neuroFis.predict(utils::Math::makeVectorXd({1., 2.}))), NeuroFisException);
  const auto nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(static_cast<void>(neuroFis.predict(utils::Math::makeVectorXd({nan}))), NeuroFisException);
  EXPECT_THROW(static_cast<void>(neuroFis.predict(utils::Math::makeMatrixXd({{1., 2.}}))), NeuroFisException);
}

TEST_F(NeuroFisTest, testObserverThroughFit) {
  NeuroFis neuroFis(10, 2, _logStream);
  NiceMock<MockTrainingObserver> observer;
  ON_CALL(observer, stopRequested()).WillByDefault(Return(false));
  EXPECT_CALL(observer, notifyEpochComplete(_, _, _)).Times(3);

  neuroFis.fit(_data, _labels, 3, .001, &observer);
}

TEST_F(NeuroFisTest, testInspect) {
  NeuroFis neuroFis(10, 3, _logStream);
  neuroFis.induce(_data, _labels);

  const auto str = neuroFis.inspect();
  EXPECT_NE(str.find("maxRules: 10 minObservationsPerRule: 3"), std::string::npos) << str;
  EXPECT_NE(str.find(R"(if ("x0" == "mf3") then class 1 (support 3))"), std::string::npos) << str;
  EXPECT_EQ(str.find(R"("mf1")"), std::string::npos) << str;
}
