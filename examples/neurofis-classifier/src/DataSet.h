/**
 * @file DataSet.h
 * @author M. Reiter
 * @date 22.09.2026
 */
#pragma once

#include <string>
#include <utility>

#include "neurofis/DataTypes.h"
#include "neurofis/utils/Random.h"

/**
 * Labeled observations: a numeric feature matrix with one integer class label per row.
 */
class DataSet {
 public:
  /**
   * Constructor.
   * @param data Observations x features.
   * @param labels One label per observation.
   */
  DataSet(neurofis::FeatureMatrix data, neurofis::LabelVector labels);

  /**
   * Reads a rectangular numeric CSV file. Empty lines are skipped.
   * @param filename
   * @param labelColumn Zero based column holding the integer label. -1 selects the last column.
   * @param hasHeader If true the first non-empty line is ignored.
   * @return
   */
  static DataSet loadCsv(const std::string &filename, int labelColumn = -1, bool hasHeader = false);

  /**
   * Permutes observations and labels with the same random permutation.
   * @param random
   */
  void shuffle(neurofis::Random &random);

  /**
   * Splits the data set in a training and a test part without reordering.
   * The last floor(testFraction * size()) observations form the test part.
   * @param testFraction Value in [0, 1).
   * @return Pair of training and test set. The test set may be empty.
   */
  [[nodiscard]] std::pair<DataSet, DataSet> split(double testFraction) const;

  /**
   * Getter for the feature matrix.
   * @return
   */
  [[nodiscard]] const neurofis::FeatureMatrix &getData() const { return _data; }

  /**
   * Getter for the labels.
   * @return
   */
  [[nodiscard]] const neurofis::LabelVector &getLabels() const { return _labels; }

  /**
   * Number of observations.
   * @return
   */
  [[nodiscard]] size_t size() const { return _labels.size(); }

  /**
   * Checks whether there are no observations.
   * @return
   */
  [[nodiscard]] bool empty() const { return _labels.empty(); }

  /**
   * Number of features.
   * @return
   */
  [[nodiscard]] size_t getNumFeatures() const { return static_cast<size_t>(_data.cols()); }

 private:
  neurofis::FeatureMatrix _data;
  neurofis::LabelVector _labels;
};
