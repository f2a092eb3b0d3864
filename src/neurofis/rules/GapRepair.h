/**
 * @file GapRepair.h
 * @author M. Reiter
 * @date 17.09.2026
 */

#pragma once

#include <optional>
#include <vector>

#include "neurofis/rules/RuleSet.h"

/**
 * Closes the coverage gaps that pruning leaves between the surviving membership functions of a feature.
 */
namespace neurofis::rules::GapRepair {

/**
 * Searches the right neighbor of a membership function: the candidate with the smallest mid that is still strictly
 * greater than the high of membershipFunction. Among equal mids the first candidate is taken.
 * @param partition
 * @param membershipFunction
 * @param candidates Membership functions to search in. membershipFunction itself is ignored.
 * @return Index of the neighbor or std::nullopt if there is none.
 */
std::optional<size_t> findRightNeighbor(const fuzzy::FeaturePartition &partition, size_t membershipFunction,
                                        const std::vector<size_t> &candidates);

/**
 * Merges every active membership function with its right neighbor if the neighbor starts strictly right of its high.
 * Merging rebinds vertices: neighbor.low becomes this.mid and this.high becomes neighbor.mid.
 * Neighbors that already overlap this function, i.e. neighbor.low <= this.high, are left unmerged, so an unpruned
 * partition comes out unchanged.
 *
 * Passes over all features are repeated until nothing changes. Afterwards the active functions of each feature cover
 * one contiguous interval and a second call performs no merge.
 *
 * @param ruleSet
 * @return Number of merges performed.
 */
size_t repair(RuleSet &ruleSet);

}  // namespace neurofis::rules::GapRepair
