/**
 * @file RuleInducer.cpp
 * @author M. Reiter
 * @date 16.09.2026
 */

#include "RuleInducer.h"

#include <fmt/format.h>

#include "neurofis/utils/ExceptionHandler.h"
#include "neurofis/utils/InputChecks.h"
#include "neurofis/utils/Math.h"
#include "neurofis/utils/logging/Logger.h"

namespace neurofis::rules::RuleInducer {

namespace {
/**
 * Partition every column of data on its observed range.
 */
std::vector<fuzzy::FeaturePartition> buildPartitions(const FeatureMatrix &data) {
  std::vector<fuzzy::FeaturePartition> partitions;
  partitions.reserve(data.cols());
  for (Eigen::Index feature = 0; feature < data.cols(); ++feature) {
    const auto column = data.col(feature);
    partitions.emplace_back(fmt::format("x{}", feature), std::make_pair(column.minCoeff(), column.maxCoeff()));
  }
  return partitions;
}
}  // namespace

std::map<GridCell, ClassCounts> countObservations(const std::vector<fuzzy::FeaturePartition> &partitions,
                                                  const FeatureMatrix &data, const LabelVector &labels) {
  std::map<GridCell, ClassCounts> counts;
  const size_t numFeatures = partitions.size();
  std::vector<std::vector<size_t>> matching(numFeatures);

  for (Eigen::Index row = 0; row < data.rows(); ++row) {
    bool inGrid = true;
    for (size_t feature = 0; feature < numFeatures; ++feature) {
      matching[feature].clear();
      for (size_t mf = 0; mf < partitions[feature].size(); ++mf) {
        if (partitions[feature].contains(mf, data(row, static_cast<Eigen::Index>(feature)))) {
          matching[feature].push_back(mf);
        }
      }
      inGrid &= not matching[feature].empty();
    }
    if (not inGrid) {
      continue;
    }

    // odometer over the cartesian product of the matching functions
    std::vector<size_t> position(numFeatures, 0);
    GridCell cell(numFeatures);
    bool done = false;
    while (not done) {
      for (size_t feature = 0; feature < numFeatures; ++feature) {
        cell[feature] = matching[feature][position[feature]];
      }
      ++counts[cell][labels[row]];

      done = true;
      for (size_t feature = numFeatures; feature-- > 0;) {
        if (++position[feature] < matching[feature].size()) {
          done = false;
          break;
        }
        position[feature] = 0;
      }
    }
  }
  return counts;
}

std::pair<ClassLabel, size_t> majorityVote(const ClassCounts &counts) {
  if (counts.empty()) {
    utils::ExceptionHandler::exception("RuleInducer::majorityVote: no class counts given.");
  }
  std::pair<ClassLabel, size_t> best{noClass, 0};
  // ascending labels, so on equal counts the later (larger) label takes over
  for (const auto &[label, count] : counts) {
    if (count >= best.second) {
      best = {label, count};
    }
  }
  return best;
}

RuleSet induce(const FeatureMatrix &data, const LabelVector &labels, size_t minObservationsPerRule) {
  utils::InputChecks::checkTrainingData(data, labels, "RuleInducer::induce");
  if (minObservationsPerRule < 1) {
    utils::ExceptionHandler::exception("RuleInducer::induce: minObservationsPerRule has to be at least 1.");
  }

  auto partitions = buildPartitions(data);
  NeuroFisLog(DEBUG, "Built {} feature partitions with {} membership functions each.", partitions.size(),
              fuzzy::FeaturePartition::numMembershipFunctions);

  size_t numCandidates = 1;
  for (const auto &partition : partitions) {
    numCandidates = utils::Math::safeMul(numCandidates, partition.size());
  }
  NeuroFisLog(DEBUG, "Rule candidates in the grid: {}", numCandidates);

  const auto counts = countObservations(partitions, data, labels);

  RuleSet ruleSet(std::move(partitions));
  size_t numUnsupported = 0;
  for (const auto &[cell, classCounts] : counts) {
    const auto [label, support] = majorityVote(classCounts);
    if (support < minObservationsPerRule) {
      ++numUnsupported;
      continue;
    }
    ruleSet.addRule(Rule{cell, cell, label, support});
  }

  NeuroFisLog(INFO, "Rule induction: {} rules kept, {} occupied cells below support {}, {} empty cells pruned.",
              ruleSet.size(), numUnsupported, minObservationsPerRule, numCandidates - counts.size());
  if (ruleSet.empty()) {
    NeuroFisLog(WARN, "Rule induction produced no rules. Every prediction will be noClass ({}).", noClass);
  }
  return ruleSet;
}

}  // namespace neurofis::rules::RuleInducer
