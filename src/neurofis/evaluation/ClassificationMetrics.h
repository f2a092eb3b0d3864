/**
 * @file ClassificationMetrics.h
 * @author M. Reiter
 * @date 19.09.2026
 */

#pragma once

#include <Eigen/Core>
#include <string>
#include <vector>

#include "neurofis/DataTypes.h"

namespace neurofis::evaluation {

/**
 * Quality of predictions compared to the true labels.
 *
 * The confusion matrix is indexed by the sorted union of all labels that occur in either vector, rows being the true
 * label and columns the predicted label. noClass predictions are counted as wrong and are not part of the predicted
 * positives, so they lower recall but not precision.
 */
class ClassificationMetrics {
 public:
  /**
   * Computes all metrics.
   * @param trueLabels
   * @param predictedLabels Same length as trueLabels.
   */
  ClassificationMetrics(const LabelVector &trueLabels, const LabelVector &predictedLabels);

  /**
   * Labels indexing rows and columns of the confusion matrix.
   * @return
   */
  [[nodiscard]] const LabelVector &getLabels() const { return _labels; }

  /**
   * Confusion matrix. Entry (i, j) counts observations of label i predicted as label j.
   * @return
   */
  [[nodiscard]] const Eigen::MatrixXi &getConfusionMatrix() const { return _confusionMatrix; }

  /**
   * Fraction of correct predictions.
   * @return
   */
  [[nodiscard]] double getAccuracy() const { return _accuracy; }

  /**
   * Micro averaged precision: correct predictions over all predictions that are not noClass.
   * @return 0 if there is no such prediction.
   */
  [[nodiscard]] double getPrecision() const { return _precision; }

  /**
   * Micro averaged recall: correct predictions over all observations.
   * @return
   */
  [[nodiscard]] double getRecall() const { return _recall; }

  /**
   * Number of compared observations.
   * @return
   */
  [[nodiscard]] size_t getNumObservations() const { return _numObservations; }

  /**
   * Index of a label in the confusion matrix.
   * @param label
   * @return
   */
  [[nodiscard]] Eigen::Index indexOf(ClassLabel label) const;

  /**
   * Report with confusion matrix and scores.
   */
  explicit operator std::string() const;

 private:
  LabelVector _labels;
  Eigen::MatrixXi _confusionMatrix;
  size_t _numObservations{0};
  double _accuracy{0.};
  double _precision{0.};
  double _recall{0.};
};

}  // namespace neurofis::evaluation
