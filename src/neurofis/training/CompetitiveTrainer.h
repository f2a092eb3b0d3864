/**
 * @file CompetitiveTrainer.h
 * @author M. Reiter
 * @date 18.09.2026
 */

#pragma once

#include <string>

#include "neurofis/DataTypes.h"
#include "neurofis/rules/RuleSet.h"
#include "neurofis/training/TrainingObserver.h"

namespace neurofis::training {

/**
 * Summary of a training run.
 */
struct TrainingStatistics {
  /**
   * Number of completed passes over the data.
   */
  size_t epochs{0};
  /**
   * Number of observations that moved the membership functions of a winning rule.
   */
  size_t updates{0};
  /**
   * Number of observations that activated no rule.
   */
  size_t skipped{0};
  /**
   * True if the observer stopped the training early.
   */
  bool cancelled{false};
  /**
   * Wall time of the run in nanoseconds.
   */
  long timeNanoseconds{0};

  /**
   * String representation for logging.
   * @return
   */
  [[nodiscard]] std::string toString() const;
};

/**
 * Winner-take-all refinement of the membership functions of a rule set.
 *
 * For every observation only the strictly most activated rule (first maximum) is updated. All its membership functions
 * are moved by the learning rate towards the observation if the rule predicts the true label and away from it
 * otherwise. Observations that activate no rule are skipped. There is no convergence criterion.
 */
class CompetitiveTrainer {
 public:
  /**
   * Constructor.
   * @param numEpochs Number of passes over the training data.
   * @param learningRate Distance every vertex is moved per update. Must be finite and not negative.
   */
  CompetitiveTrainer(size_t numEpochs, double learningRate);

  /**
   * Trains the rule set in place.
   * @param ruleSet
   * @param data Observations x features. The number of features has to match the rule set.
   * @param labels One label per observation.
   * @param observer Optional progress observer. Not owned.
   * @return Statistics of the run.
   */
  TrainingStatistics train(rules::RuleSet &ruleSet, const FeatureMatrix &data, const LabelVector &labels,
                           TrainingObserver *observer = nullptr) const;

  /**
   * Performs the update for a single observation.
   * @param ruleSet
   * @param observation
   * @param label True label of the observation.
   * @param activeFunctions Active membership functions per feature.
   * @return True if a rule was updated, false if the observation activated no rule.
   */
  bool trainObservation(rules::RuleSet &ruleSet, const Observation &observation, ClassLabel label,
                        const std::vector<std::vector<size_t>> &activeFunctions) const;

  /**
   * Getter for the number of epochs.
   * @return
   */
  [[nodiscard]] size_t getNumEpochs() const { return _numEpochs; }

  /**
   * Getter for the learning rate.
   * @return
   */
  [[nodiscard]] double getLearningRate() const { return _learningRate; }

 private:
  size_t _numEpochs;
  double _learningRate;
};

}  // namespace neurofis::training
