/**
 * @file CompetitiveTrainer.cpp
 * @author M. Reiter
 * @date 18.09.2026
 */

#include "CompetitiveTrainer.h"

#include <fmt/format.h>

#include "neurofis/utils/ExceptionHandler.h"
#include "neurofis/utils/InputChecks.h"
#include "neurofis/utils/Timer.h"
#include "neurofis/utils/logging/Logger.h"

namespace neurofis::training {

std::string TrainingStatistics::toString() const {
  return fmt::format("epochs: {} updates: {} skipped: {} cancelled: {} time: {:.3f} ms", epochs, updates, skipped,
                     cancelled, static_cast<double>(timeNanoseconds) * 1e-6);
}

CompetitiveTrainer::CompetitiveTrainer(size_t numEpochs, double learningRate)
    : _numEpochs(numEpochs), _learningRate(learningRate) {
  utils::InputChecks::checkLearningRate(_learningRate, "CompetitiveTrainer");
}

bool CompetitiveTrainer::trainObservation(rules::RuleSet &ruleSet, const Observation &observation, ClassLabel label,
                                          const std::vector<std::vector<size_t>> &activeFunctions) const {
  const auto winner = ruleSet.findWinner(observation, TieBreakOption::firstMaximum);
  if (not winner) {
    return false;
  }
  const auto &rule = *winner->rule;
  const bool towards = rule.classLabel == label;
  for (size_t feature = 0; feature < ruleSet.getNumFeatures(); ++feature) {
    ruleSet.getPartition(feature).moveMembershipFunction(rule.membershipFunctions[feature], observation[feature],
                                                         _learningRate, towards, activeFunctions[feature]);
  }
  return true;
}

TrainingStatistics CompetitiveTrainer::train(rules::RuleSet &ruleSet, const FeatureMatrix &data,
                                             const LabelVector &labels, TrainingObserver *observer) const {
  utils::InputChecks::checkTrainingData(data, labels, "CompetitiveTrainer::train");
  if (static_cast<size_t>(data.cols()) != ruleSet.getNumFeatures()) {
    utils::ExceptionHandler::exception("CompetitiveTrainer::train: data has {} features but the rule set {}.",
                                       data.cols(), ruleSet.getNumFeatures());
  }

  TrainingStatistics statistics;
  utils::Timer timer;
  timer.start();

  // the rule structure is fixed during training
  std::vector<std::vector<size_t>> activeFunctions;
  activeFunctions.reserve(ruleSet.getNumFeatures());
  for (size_t feature = 0; feature < ruleSet.getNumFeatures(); ++feature) {
    activeFunctions.push_back(ruleSet.activeMembershipFunctions(feature));
  }

  for (size_t epoch = 0; epoch < _numEpochs and not statistics.cancelled; ++epoch) {
    size_t epochUpdates = 0;
    size_t epochSkipped = 0;
    for (Eigen::Index row = 0; row < data.rows(); ++row) {
      if (observer and observer->stopRequested()) {
        statistics.cancelled = true;
        break;
      }
      const Observation observation = data.row(row).transpose();
      if (trainObservation(ruleSet, observation, labels[row], activeFunctions)) {
        ++epochUpdates;
      } else {
        ++epochSkipped;
      }
    }
    statistics.updates += epochUpdates;
    statistics.skipped += epochSkipped;
    if (statistics.cancelled) {
      NeuroFisLog(INFO, "Training cancelled in epoch {}.", epoch);
      break;
    }
    ++statistics.epochs;
    NeuroFisLog(DEBUG, "Epoch {} complete: {} updates, {} skipped observations.", epoch, epochUpdates, epochSkipped);
    if (observer) {
      observer->notifyEpochComplete(epoch, epochUpdates, epochSkipped);
    }
  }

  statistics.timeNanoseconds = timer.stop();
  NeuroFisLog(INFO, "Training done: {}", statistics.toString());
  return statistics;
}

}  // namespace neurofis::training
