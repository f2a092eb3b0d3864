/**
 * @file Experiment.h
 * @author M. Reiter
 * @date 22.09.2026
 */
#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>

#include "DataSet.h"
#include "neurofis/NeuroFis.h"
#include "neurofis/evaluation/ClassificationMetrics.h"
#include "neurofis/training/CompetitiveTrainer.h"
#include "src/configuration/ClassifierConfig.h"

/**
 * One run of the classifier as described by a configuration:
 * load the data, shuffle and split it, fit the classifier and evaluate it.
 */
class Experiment {
 public:
  /**
   * Constructor. Sets up the log output and the classifier.
   * @param configuration
   * @param outputStream Stream for the report. Default is std::cout.
   */
  explicit Experiment(const ClassifierConfig &configuration, std::ostream &outputStream = std::cout);

  /**
   * Runs the experiment on the data file of the configuration.
   */
  void run();

  /**
   * Runs the experiment on the given data.
   * @param dataSet
   */
  void run(DataSet dataSet);

  /**
   * Getter for the classifier.
   * @return
   */
  [[nodiscard]] const neurofis::NeuroFis &getClassifier() const { return *_classifier; }

  /**
   * Statistics of the last training.
   * @return
   */
  [[nodiscard]] const neurofis::training::TrainingStatistics &getTrainingStatistics() const {
    return _trainingStatistics;
  }

  /**
   * Metrics of the last evaluation.
   * @return std::nullopt before run().
   */
  [[nodiscard]] const std::optional<neurofis::evaluation::ClassificationMetrics> &getMetrics() const {
    return _metrics;
  }

 private:
  ClassifierConfig _configuration;

  std::ostream &_outputStream;

  /**
   * Only used if a log file is configured.
   */
  std::shared_ptr<std::ofstream> _logFile;

  std::unique_ptr<neurofis::NeuroFis> _classifier;

  neurofis::training::TrainingStatistics _trainingStatistics{};

  std::optional<neurofis::evaluation::ClassificationMetrics> _metrics{};
};
