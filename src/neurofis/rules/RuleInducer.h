/**
 * @file RuleInducer.h
 * @author M. Reiter
 * @date 16.09.2026
 */

#pragma once

#include <map>

#include "neurofis/DataTypes.h"
#include "neurofis/rules/RuleSet.h"

/**
 * Induction of the initial rule base from labeled observations.
 */
namespace neurofis::rules::RuleInducer {

/**
 * Number of observations per class label that fall into one grid cell.
 */
using ClassCounts = std::map<ClassLabel, size_t>;

/**
 * Builds the default partition of every feature and counts for every grid cell how many observations of each class
 * fall into it. An observation falls into a cell if every feature value lies in the closed [low, high] interval of
 * the cell's membership function for that feature. Cells without observations are not listed.
 *
 * @param partitions One default partition per feature, in feature order.
 * @param data
 * @param labels
 * @return Class counts per non-empty grid cell.
 */
std::map<GridCell, ClassCounts> countObservations(const std::vector<fuzzy::FeaturePartition> &partitions,
                                                  const FeatureMatrix &data, const LabelVector &labels);

/**
 * Majority vote over the class counts of one cell.
 * The highest count wins. On equal counts the largest label wins, independent of the order in which the counts were
 * collected.
 * @param counts Non-empty class counts.
 * @return Winning label and its count.
 */
std::pair<ClassLabel, size_t> majorityVote(const ClassCounts &counts);

/**
 * Induces the initial rule set.
 *
 * Every grid cell whose majority class is supported by at least minObservationsPerRule observations becomes a rule
 * with that class. All other cells are pruned. An empty result is valid.
 *
 * @param data Observations x features.
 * @param labels One non-negative label per observation.
 * @param minObservationsPerRule Support threshold, at least 1.
 * @return
 */
RuleSet induce(const FeatureMatrix &data, const LabelVector &labels, size_t minObservationsPerRule);

}  // namespace neurofis::rules::RuleInducer
