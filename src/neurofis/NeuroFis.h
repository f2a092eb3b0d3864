/**
 * @file NeuroFis.h
 * @author M. Reiter
 * @date 20.09.2026
 */

#pragma once

#include <iostream>
#include <string>

#include "neurofis/DataTypes.h"
#include "neurofis/evaluation/ClassificationMetrics.h"
#include "neurofis/rules/RuleSet.h"
#include "neurofis/training/CompetitiveTrainer.h"
#include "neurofis/training/TrainingObserver.h"

namespace neurofis {

/**
 * The NeuroFis class is intended to be the main point of interaction for the user.
 *
 * A classifier is built in three steps: induce() creates the rule grid from labeled observations, repair() closes the
 * coverage gaps left by pruning and train() refines the membership functions. fit() runs all three.
 * The resulting rule set is then used by predict() and evaluate().
 */
class NeuroFis {
 public:
  /**
   * Constructor for the NeuroFis class.
   * @param maxRules Upper bound of the rule count. Only reported, induction does not enforce it.
   * @param minObservationsPerRule Minimal support of the majority class for a grid cell to become a rule.
   * @param logOutputStream Stream where log output should go to. Default is std::cout.
   */
  explicit NeuroFis(size_t maxRules = 10, size_t minObservationsPerRule = 5, std::ostream &logOutputStream = std::cout);

  ~NeuroFis();

  NeuroFis(const NeuroFis &other) = delete;

  NeuroFis &operator=(const NeuroFis &other) = delete;

  /**
   * Induces, repairs and trains the classifier. Previous state is discarded.
   * The data is used in the given order. Shuffle it beforehand if needed.
   * @param data Observations x features.
   * @param labels One non-negative label per observation.
   * @param numEpochs Number of training passes.
   * @param learningRate Vertex shift per training update.
   * @param observer Optional training observer. Not owned.
   * @return Statistics of the training phase.
   */
  training::TrainingStatistics fit(const FeatureMatrix &data, const LabelVector &labels, size_t numEpochs,
                                   double learningRate, training::TrainingObserver *observer = nullptr);

  /**
   * Replaces the rule set by the one induced from the given data.
   * @param data
   * @param labels
   * @return Number of induced rules.
   */
  size_t induce(const FeatureMatrix &data, const LabelVector &labels);

  /**
   * Closes coverage gaps of the current rule set.
   * @return Number of merges.
   */
  size_t repair();

  /**
   * Competitive training of the current rule set.
   * @param data
   * @param labels
   * @param numEpochs
   * @param learningRate
   * @param observer Optional training observer. Not owned.
   * @return
   */
  training::TrainingStatistics train(const FeatureMatrix &data, const LabelVector &labels, size_t numEpochs,
                                     double learningRate, training::TrainingObserver *observer = nullptr);

  /**
   * Class of the most activated rule. Among equally activated rules the last one wins.
   * @param observation
   * @return Label or noClass if there are no rules.
   */
  [[nodiscard]] ClassLabel predict(const Observation &observation) const;

  /**
   * Predicts every row of data.
   * @param data
   * @return One label per row.
   */
  [[nodiscard]] LabelVector predict(const FeatureMatrix &data) const;

  /**
   * Predicts data and compares with the true labels.
   * @param data
   * @param labels
   * @return
   */
  [[nodiscard]] evaluation::ClassificationMetrics evaluate(const FeatureMatrix &data, const LabelVector &labels) const;

  /**
   * Human readable description of the parameters and the rule set.
   * @return
   */
  [[nodiscard]] std::string inspect() const;

  /**
   * Checks whether a rule set was induced.
   * @return
   */
  [[nodiscard]] bool isInduced() const { return _ruleSet.getNumFeatures() > 0; }

  /**
   * Getter for the rule set.
   * @return
   */
  [[nodiscard]] const rules::RuleSet &getRuleSet() const { return _ruleSet; }

  /**
   * Getter for maxRules.
   * @return
   */
  [[nodiscard]] size_t getMaxRules() const { return _maxRules; }

  /**
   * Getter for minObservationsPerRule.
   * @return
   */
  [[nodiscard]] size_t getMinObservationsPerRule() const { return _minObservationsPerRule; }

 private:
  void checkInduced(const std::string &caller) const;

  size_t _maxRules;

  size_t _minObservationsPerRule;

  rules::RuleSet _ruleSet{};
};

}  // namespace neurofis
