/**
 * @file InputChecks.h
 * @author M. Reiter
 * @date 16.09.2026
 */

#pragma once

#include <string>

#include "neurofis/DataTypes.h"

/**
 * Precondition checks for data handed to the library. Violations are reported through the ExceptionHandler.
 */
namespace neurofis::utils::InputChecks {

/**
 * Checks that the matrix holds at least one observation and one feature and only finite values.
 * @param data
 * @param caller Name of the calling function for the error message.
 */
void checkFeatureMatrix(const FeatureMatrix &data, const std::string &caller);

/**
 * Checks the feature matrix and that there is exactly one non-negative label per observation.
 * @param data
 * @param labels
 * @param caller Name of the calling function for the error message.
 */
void checkTrainingData(const FeatureMatrix &data, const LabelVector &labels, const std::string &caller);

/**
 * Checks that the learning rate is finite and not negative.
 * @param learningRate
 * @param caller Name of the calling function for the error message.
 */
void checkLearningRate(double learningRate, const std::string &caller);

}  // namespace neurofis::utils::InputChecks
