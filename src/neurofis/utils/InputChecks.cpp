/**
 * @file InputChecks.cpp
 * @author M. Reiter
 * @date 16.09.2026
 */

#include "InputChecks.h"

#include <algorithm>
#include <cmath>

#include "neurofis/utils/ExceptionHandler.h"

namespace neurofis::utils::InputChecks {

void checkFeatureMatrix(const FeatureMatrix &data, const std::string &caller) {
  if (data.rows() == 0) {
    ExceptionHandler::exception("{}: no observations given.", caller);
  }
  if (data.cols() == 0) {
    ExceptionHandler::exception("{}: observations have no features.", caller);
  }
  if (not data.allFinite()) {
    ExceptionHandler::exception("{}: feature matrix contains non-finite values.", caller);
  }
}

void checkTrainingData(const FeatureMatrix &data, const LabelVector &labels, const std::string &caller) {
  checkFeatureMatrix(data, caller);
  if (static_cast<size_t>(data.rows()) != labels.size()) {
    ExceptionHandler::exception("{}: {} observations but {} labels.", caller, data.rows(), labels.size());
  }
  const auto negativeLabel = std::find_if(labels.begin(), labels.end(), [](ClassLabel label) { return label < 0; });
  if (negativeLabel != labels.end()) {
    ExceptionHandler::exception("{}: class labels must not be negative (found {} at position {}).", caller,
                                *negativeLabel, std::distance(labels.begin(), negativeLabel));
  }
}

void checkLearningRate(double learningRate, const std::string &caller) {
  if (not std::isfinite(learningRate) or learningRate < 0.) {
    ExceptionHandler::exception("{}: invalid learning rate {}.", caller, learningRate);
  }
}

}  // namespace neurofis::utils::InputChecks
