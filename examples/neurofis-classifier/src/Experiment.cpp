/**
 * @file Experiment.cpp
 * @author M. Reiter
 * @date 22.09.2026
 */
#include "Experiment.h"

#include <stdexcept>

#include "neurofis/utils/Random.h"
#include "neurofis/utils/WrapOpenMP.h"
#include "neurofis/utils/logging/Logger.h"

Experiment::Experiment(const ClassifierConfig &configuration, std::ostream &outputStream)
    : _configuration(configuration), _outputStream(outputStream) {
  std::ostream *logStream = &std::cout;
  if (not _configuration.logFileName.value.empty()) {
    _logFile = std::make_shared<std::ofstream>();
    _logFile->open(_configuration.logFileName.value);
    if (not _logFile->is_open()) {
      throw std::runtime_error("Experiment: could not open log file " + _configuration.logFileName.value);
    }
    logStream = &(*_logFile);
  }

  _classifier = std::make_unique<neurofis::NeuroFis>(_configuration.maxRules.value,
                                                     _configuration.minObservationsPerRule.value, *logStream);
  neurofis::Logger::get()->set_level(_configuration.logLevel.value);
}

void Experiment::run() {
  run(DataSet::loadCsv(_configuration.dataFile.value, _configuration.labelColumn.value, _configuration.hasHeader.value));
}

void Experiment::run(DataSet dataSet) {
  NeuroFisLog(INFO, "Loaded {} observations with {} features.", dataSet.size(), dataSet.getNumFeatures());

  // shuffling reduces the risk of rules overriding each other during training
  if (not _configuration.noShuffle.value) {
    neurofis::Random random(_configuration.seed.value);
    dataSet.shuffle(random);
  }

  auto [trainSet, testSet] = dataSet.split(_configuration.testFraction.value);
  if (testSet.empty()) {
    NeuroFisLog(INFO, "No held-out observations. Evaluating on the training data.");
  }

  _trainingStatistics = _classifier->fit(trainSet.getData(), trainSet.getLabels(), _configuration.iterations.value,
                                         _configuration.learningRate.value);

  if (_configuration.inspect.value) {
    _outputStream << _classifier->inspect() << std::endl;
  }

  const auto &evaluationSet = testSet.empty() ? trainSet : testSet;
  _metrics.emplace(_classifier->evaluate(evaluationSet.getData(), evaluationSet.getLabels()));
  _outputStream << static_cast<std::string>(*_metrics) << std::endl;
  _outputStream << "Using " << neurofis::neurofis_get_max_threads() << " Threads" << std::endl;
}
