/**
 * @file DataTypes.h
 * @author M. Reiter
 * @date 14.09.2026
 */

#pragma once

#include <Eigen/Core>
#include <vector>

namespace neurofis {

/**
 * Observations x features. Every row is one observation.
 */
using FeatureMatrix = Eigen::MatrixXd;

/**
 * One observation with one entry per feature.
 */
using Observation = Eigen::VectorXd;

/**
 * Class labels are non-negative integers.
 */
using ClassLabel = int;

/**
 * One label per observation.
 */
using LabelVector = std::vector<ClassLabel>;

/**
 * Prediction if no rule exists.
 */
constexpr ClassLabel noClass{-1};

}  // namespace neurofis
