/**
 * @file GapRepair.cpp
 * @author M. Reiter
 * @date 17.09.2026
 */

#include "GapRepair.h"

#include "neurofis/utils/logging/Logger.h"

namespace neurofis::rules::GapRepair {

std::optional<size_t> findRightNeighbor(const fuzzy::FeaturePartition &partition, size_t membershipFunction,
                                        const std::vector<size_t> &candidates) {
  const double high = partition.highOf(membershipFunction);
  std::optional<size_t> neighbor{};
  for (const auto candidate : candidates) {
    if (candidate == membershipFunction) {
      continue;
    }
    const double mid = partition.midOf(candidate);
    if (mid > high and (not neighbor or mid < partition.midOf(*neighbor))) {
      neighbor = candidate;
    }
  }
  return neighbor;
}

size_t repair(RuleSet &ruleSet) {
  size_t numMerges = 0;
  size_t numPasses = 0;
  bool merged = true;
  // every merge moves a high to a strictly greater existing vertex position, so this terminates
  while (merged) {
    merged = false;
    ++numPasses;
    for (size_t feature = 0; feature < ruleSet.getNumFeatures(); ++feature) {
      auto &partition = ruleSet.getPartition(feature);
      const auto active = ruleSet.activeMembershipFunctions(feature);
      for (const auto membershipFunction : active) {
        const auto neighbor = findRightNeighbor(partition, membershipFunction, active);
        if (neighbor and partition.lowOf(*neighbor) > partition.highOf(membershipFunction)) {
          NeuroFisLog(TRACE, "Feature {}: closing gap between mf{} and mf{} ({} < {}).", partition.getName(),
                      membershipFunction, *neighbor, partition.highOf(membershipFunction), partition.lowOf(*neighbor));
          partition.mergeWithRightNeighbor(membershipFunction, *neighbor);
          ++numMerges;
          merged = true;
        }
      }
    }
  }
  NeuroFisLog(INFO, "Repair complete: {} merges in {} passes.", numMerges, numPasses);
  return numMerges;
}

}  // namespace neurofis::rules::GapRepair
