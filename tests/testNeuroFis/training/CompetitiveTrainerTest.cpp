/**
 * @file CompetitiveTrainerTest.cpp
 * @author M. Reiter
 * @date 26.09.2026
 */

#include "CompetitiveTrainerTest.h"

#include <limits>

#include "mocks/MockTrainingObserver.h"
#include "neurofis/training/CompetitiveTrainer.h"
#include "neurofis/utils/ExceptionHandler.h"
#include "neurofis/utils/Math.h"

using namespace neurofis;
using namespace neurofis::training;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using NeuroFisException = utils::ExceptionHandler::NeuroFisException;

rules::RuleSet CompetitiveTrainerTest::makeRuleSet() {
  rules::RuleSet ruleSet({fuzzy::FeaturePartition("x0", {0., 6.})});
  ruleSet.addRule(rules::Rule{{1}, {1}, 0, 1});
  ruleSet.addRule(rules::Rule{{3}, {3}, 1, 1});
  return ruleSet;
}

std::vector<std::vector<size_t>> CompetitiveTrainerTest::activeFunctions(const rules::RuleSet &ruleSet) {
  std::vector<std::vector<size_t>> active;
  for (size_t feature = 0; feature < ruleSet.getNumFeatures(); ++feature) {
    active.push_back(ruleSet.activeMembershipFunctions(feature));
  }
  return active;
}

std::vector<double> CompetitiveTrainerTest::positions(const rules::RuleSet &ruleSet) {
  const auto &vertices = ruleSet.getPartition(0).getVertices();
  std::vector<double> result;
  for (fuzzy::VertexId id = 0; id < vertices.size(); ++id) {
    result.push_back(vertices.at(id));
  }
  return result;
}

TEST_F(CompetitiveTrainerTest, testMoveTowardsMatchingClass) {
  auto ruleSet = makeRuleSet();
  const CompetitiveTrainer trainer(1, .25);

  // mf1 (1, 2, 3) is the only rule activated by 2.5
  EXPECT_TRUE(trainer.trainObservation(ruleSet, utils::Math::makeVectorXd({2.5}), 0, activeFunctions(ruleSet)));

  const auto &partition = ruleSet.getPartition(0);
  EXPECT_DOUBLE_EQ(partition.lowOf(1), 1.25);
  EXPECT_DOUBLE_EQ(partition.midOf(1), 2.25);
  EXPECT_DOUBLE_EQ(partition.highOf(1), 2.75);
  // the shared vertex moved for mf3 as well
  EXPECT_DOUBLE_EQ(partition.lowOf(3), 2.75);
  EXPECT_DOUBLE_EQ(partition.midOf(3), 4.);
}

TEST_F(CompetitiveTrainerTest, testMoveAwayFromOtherClass) {
  auto ruleSet = makeRuleSet();
  const CompetitiveTrainer trainer(1, .25);

  EXPECT_TRUE(trainer.trainObservation(ruleSet, utils::Math::makeVectorXd({2.5}), 1, activeFunctions(ruleSet)));

  const auto &partition = ruleSet.getPartition(0);
  EXPECT_DOUBLE_EQ(partition.lowOf(1), .75);
  EXPECT_DOUBLE_EQ(partition.midOf(1), 1.75);
  EXPECT_DOUBLE_EQ(partition.highOf(1), 3.25);
}

TEST_F(CompetitiveTrainerTest, testSkipWithoutActivation) {
  auto ruleSet = makeRuleSet();
  const auto before = positions(ruleSet);
  const CompetitiveTrainer trainer(1, .25);

  EXPECT_FALSE(trainer.trainObservation(ruleSet, utils::Math::makeVectorXd({.5}), 0, activeFunctions(ruleSet)));
  EXPECT_EQ(positions(ruleSet), before);
}

TEST_F(CompetitiveTrainerTest, testZeroEpochs) {
  auto ruleSet = makeRuleSet();
  const auto before = positions(ruleSet);

  const auto statistics =
      CompetitiveTrainer(0, .25).train(ruleSet, utils::Math::makeMatrixXd({{2.5}, {3.5}}), {0, 1});

  EXPECT_EQ(positions(ruleSet), before);
  EXPECT_EQ(statistics.epochs, 0ul);
  EXPECT_EQ(statistics.updates, 0ul);
  EXPECT_FALSE(statistics.cancelled);
}

TEST_F(CompetitiveTrainerTest, testZeroLearningRate) {
  auto ruleSet = makeRuleSet();
  const auto before = positions(ruleSet);

  const auto statistics =
      CompetitiveTrainer(5, 0.).train(ruleSet, utils::Math::makeMatrixXd({{2.5}, {3.5}}), {1, 0});

  EXPECT_EQ(positions(ruleSet), before);
  EXPECT_EQ(statistics.updates, 10ul);
}

TEST_F(CompetitiveTrainerTest, testStatistics) {
  auto ruleSet = makeRuleSet();

  const auto statistics = CompetitiveTrainer(1, .1).train(ruleSet, utils::Math::makeMatrixXd({{2.5}, {.5}}), {0, 0});

  EXPECT_EQ(statistics.epochs, 1ul);
  EXPECT_EQ(statistics.updates, 1ul);
  EXPECT_EQ(statistics.skipped, 1ul);
  EXPECT_GE(statistics.timeNanoseconds, 0l);
  EXPECT_NE(statistics.toString().find("skipped: 1"), std::string::npos);
}

TEST_F(CompetitiveTrainerTest, testFunctionsStayOrdered) {
  auto ruleSet = makeRuleSet();
  const auto data = utils::Math::makeMatrixXd({{1.5}, {2.5}, {2.9}, {3.1}, {3.5}, {4.5}});

  CompetitiveTrainer(50, .3).train(ruleSet, data, {1, 1, 0, 1, 0, 0});

  const auto &partition = ruleSet.getPartition(0);
  for (const auto mf : ruleSet.activeMembershipFunctions(0)) {
    EXPECT_TRUE(partition.getMembershipFunction(mf).isOrdered(partition.getVertices())) << partition.toString();
  }
}

TEST_F(CompetitiveTrainerTest, testObserverNotifiedPerEpoch) {
  auto ruleSet = makeRuleSet();
  MockTrainingObserver observer;
  EXPECT_CALL(observer, stopRequested()).WillRepeatedly(Return(false));
  {
    InSequence seq;
    for (size_t epoch = 0; epoch < 3; ++epoch) {
      EXPECT_CALL(observer, notifyEpochComplete(epoch, 2, 0)).Times(1);
    }
  }

  const auto statistics =
      CompetitiveTrainer(3, .01).train(ruleSet, utils::Math::makeMatrixXd({{2.}, {4.}}), {0, 1}, &observer);

  EXPECT_EQ(statistics.epochs, 3ul);
  EXPECT_EQ(statistics.updates, 6ul);
  EXPECT_FALSE(statistics.cancelled);
}

TEST_F(CompetitiveTrainerTest, testCancellation) {
  auto ruleSet = makeRuleSet();
  MockTrainingObserver observer;
  // one full epoch of two observations, then stop
  EXPECT_CALL(observer, stopRequested())
      .Times(3)
      .WillOnce(Return(false))
      .WillOnce(Return(false))
      .WillOnce(Return(true));
  EXPECT_CALL(observer, notifyEpochComplete(0, 2, 0)).Times(1);
  EXPECT_CALL(observer, notifyEpochComplete(1, _, _)).Times(0);

  const auto statistics =
      CompetitiveTrainer(100, .01).train(ruleSet, utils::Math::makeMatrixXd({{2.}, {4.}}), {0, 1}, &observer);

  EXPECT_TRUE(statistics.cancelled);
  EXPECT_EQ(statistics.epochs, 1ul);
  EXPECT_EQ(statistics.updates, 2ul);
}

TEST_F(CompetitiveTrainerTest, testInvalidArguments) {
  EXPECT_THROW(CompetitiveTrainer(1, -.1), NeuroFisException);
  EXPECT_THROW(CompetitiveTrainer(1, std::numeric_limits<double>::infinity()), NeuroFisException);

  auto ruleSet = makeRuleSet();
  const CompetitiveTrainer trainer(1, .1);
  EXPECT_THROW(trainer.train(ruleSet, utils::Math::makeMatrixXd({{1., 2.}}), {0}), NeuroFisException);
  EXPECT_THROW(trainer.train(ruleSet, utils::Math::makeMatrixXd({{1.}, {2.}}), {0}), NeuroFisException);
  EXPECT_THROW(trainer.train(ruleSet, utils::Math::makeMatrixXd({{1.}}), {-2}), NeuroFisException);
}
