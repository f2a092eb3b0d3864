/**
 * @file NeuroFis.cpp
 * @author M. Reiter
 * @date 20.09.2026
 */

#include "NeuroFis.h"

#include <fmt/format.h>

#include "neurofis/InstanceCounter.h"
#include "neurofis/rules/GapRepair.h"
#include "neurofis/rules/RuleInducer.h"
#include "neurofis/utils/ExceptionHandler.h"
#include "neurofis/utils/InputChecks.h"
#include "neurofis/utils/logging/Logger.h"

namespace neurofis {

NeuroFis::NeuroFis(size_t maxRules, size_t minObservationsPerRule, std::ostream &logOutputStream)
    : _maxRules(maxRules), _minObservationsPerRule(minObservationsPerRule) {
  if (_minObservationsPerRule < 1) {
    utils::ExceptionHandler::exception("NeuroFis: minObservationsPerRule has to be at least 1.");
  }
  // count the number of instances. This is needed to ensure that the logger is not unregistered while other
  // instances are still using it.
  InstanceCounter::count++;
  // replaces a logger of another instance, warnings and errors are flushed right away
  Logger::create(logOutputStream);
}

NeuroFis::~NeuroFis() {
  InstanceCounter::count--;
  if (InstanceCounter::count == 0) {
    // remove the Logger from the registry. Do this only if we have no other instances running.
    Logger::unregister();
  }
}

training::TrainingStatistics NeuroFis::fit(const FeatureMatrix &data, const LabelVector &labels, size_t numEpochs,
                                           double learningRate, training::TrainingObserver *observer) {
  // reject everything before the first phase starts
  utils::InputChecks::checkTrainingData(data, labels, "NeuroFis::fit");
  utils::InputChecks::checkLearningRate(learningRate, "NeuroFis::fit");

  induce(data, labels);
  repair();
  return train(data, labels, numEpochs, learningRate, observer);
}

size_t NeuroFis::induce(const FeatureMatrix &data, const LabelVector &labels) {
  _ruleSet = rules::RuleInducer::induce(data, labels, _minObservationsPerRule);
  if (_ruleSet.size() > _maxRules) {
    NeuroFisLog(WARN, "Induced {} rules which is more than maxRules ({}). The limit is not enforced.", _ruleSet.size(),
                _maxRules);
  }
  return _ruleSet.size();
}

size_t NeuroFis::repair() {
  checkInduced("NeuroFis::repair");
  return rules::GapRepair::repair(_ruleSet);
}

training::TrainingStatistics NeuroFis::train(const FeatureMatrix &data, const LabelVector &labels, size_t numEpochs,
                                             double learningRate, training::TrainingObserver *observer) {
  checkInduced("NeuroFis::train");
  training::CompetitiveTrainer trainer(numEpochs, learningRate);
  return trainer.train(_ruleSet, data, labels, observer);
}

ClassLabel NeuroFis::predict(const Observation &observation) const {
  checkInduced("NeuroFis::predict");
  if (not observation.allFinite()) {
    utils::ExceptionHandler::exception("NeuroFis::predict: observation contains non-finite values.");
  }
  return _ruleSet.classify(observation);
}

LabelVector NeuroFis::predict(const FeatureMatrix &data) const {
  checkInduced("NeuroFis::predict");
  utils::InputChecks::checkFeatureMatrix(data, "NeuroFis::predict");
  LabelVector predictions;
  predictions.reserve(data.rows());
  for (Eigen::Index row = 0; row < data.rows(); ++row) {
    predictions.push_back(_ruleSet.classify(data.row(row).transpose()));
  }
  return predictions;
}

evaluation::ClassificationMetrics NeuroFis::evaluate(const FeatureMatrix &data, const LabelVector &labels) const {
  utils::InputChecks::checkTrainingData(data, labels, "NeuroFis::evaluate");
  evaluation::ClassificationMetrics metrics(labels, predict(data));
  NeuroFisLog(DEBUG, "Evaluation on {} observations: accuracy {}", metrics.getNumObservations(),
              metrics.getAccuracy());
  return metrics;
}

std::string NeuroFis::inspect() const {
  return fmt::format("NeuroFis: maxRules: {} minObservationsPerRule: {}\n{}", _maxRules, _minObservationsPerRule,
                     static_cast<std::string>(_ruleSet));
}

void NeuroFis::checkInduced(const std::string &caller) const {
  if (not isInduced()) {
    utils::ExceptionHandler::exception("{}: no rule set induced yet. Call induce() or fit() first.", caller);
  }
}

}  // namespace neurofis
