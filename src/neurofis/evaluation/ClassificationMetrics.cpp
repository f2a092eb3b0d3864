/**
 * @file ClassificationMetrics.cpp
 * @author M. Reiter
 * @date 19.09.2026
 */

#include "ClassificationMetrics.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <set>

#include "neurofis/utils/ExceptionHandler.h"

namespace neurofis::evaluation {

ClassificationMetrics::ClassificationMetrics(const LabelVector &trueLabels, const LabelVector &predictedLabels)
    : _numObservations(trueLabels.size()) {
  if (trueLabels.size() != predictedLabels.size()) {
    utils::ExceptionHandler::exception("ClassificationMetrics: {} true labels but {} predictions.", trueLabels.size(),
                                       predictedLabels.size());
  }
  if (trueLabels.empty()) {
    utils::ExceptionHandler::exception("ClassificationMetrics: no labels given.");
  }

  std::set<ClassLabel> labels(trueLabels.begin(), trueLabels.end());
  labels.insert(predictedLabels.begin(), predictedLabels.end());
  _labels.assign(labels.begin(), labels.end());

  _confusionMatrix = Eigen::MatrixXi::Zero(_labels.size(), _labels.size());
  size_t numCorrect = 0;
  size_t numPredicted = 0;
  for (size_t i = 0; i < trueLabels.size(); ++i) {
    ++_confusionMatrix(indexOf(trueLabels[i]), indexOf(predictedLabels[i]));
    if (predictedLabels[i] != noClass) {
      ++numPredicted;
      if (predictedLabels[i] == trueLabels[i]) {
        ++numCorrect;
      }
    }
  }

  _accuracy = static_cast<double>(numCorrect) / static_cast<double>(_numObservations);
  _precision = numPredicted == 0 ? 0. : static_cast<double>(numCorrect) / static_cast<double>(numPredicted);
  _recall = _accuracy;
}

Eigen::Index ClassificationMetrics::indexOf(ClassLabel label) const {
  const auto it = std::lower_bound(_labels.begin(), _labels.end(), label);
  if (it == _labels.end() or *it != label) {
    utils::ExceptionHandler::exception("ClassificationMetrics::indexOf: unknown label {}.", label);
  }
  return std::distance(_labels.begin(), it);
}

ClassificationMetrics::operator std::string() const {
  std::string matrixStr;
  for (Eigen::Index row = 0; row < _confusionMatrix.rows(); ++row) {
    std::vector<int> entries(_confusionMatrix.cols());
    for (Eigen::Index col = 0; col < _confusionMatrix.cols(); ++col) {
      entries[col] = _confusionMatrix(row, col);
    }
    matrixStr += fmt::format("  {:>6} | {:>6}\n", _labels[row], fmt::join(entries, " "));
  }
  return fmt::format(
      "Observations    : {}\n"
      "Labels          : [{}]\n"
      "Confusion matrix (rows = true, columns = predicted):\n{}"
      "Accuracy score  : {:.4f}\n"
      "Precision       : {:.4f}\n"
      "Recall          : {:.4f}",
      _numObservations, fmt::join(_labels, ", "), matrixStr, _accuracy, _precision, _recall);
}

}  // namespace neurofis::evaluation
