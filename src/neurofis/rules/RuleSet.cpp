/**
 * @file RuleSet.cpp
 * @author M. Reiter
 * @date 15.09.2026
 */

#include "RuleSet.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <numeric>

#include "neurofis/utils/ExceptionHandler.h"

namespace neurofis::rules {

RuleSet::RuleSet(std::vector<fuzzy::FeaturePartition> partitions) : _partitions(std::move(partitions)) {}

void RuleSet::addRule(Rule rule) {
  if (rule.membershipFunctions.size() != _partitions.size()) {
    utils::ExceptionHandler::exception("RuleSet::addRule: rule has {} antecedents but there are {} features.",
                                       rule.membershipFunctions.size(), _partitions.size());
    return;
  }
  for (size_t feature = 0; feature < _partitions.size(); ++feature) {
    if (rule.membershipFunctions[feature] >= _partitions[feature].size()) {
      utils::ExceptionHandler::exception("RuleSet::addRule: membership function {} does not exist for feature {}.",
                                         rule.membershipFunctions[feature], feature);
      return;
    }
  }
  if (rule.classLabel < 0) {
    utils::ExceptionHandler::exception("RuleSet::addRule: invalid class label {}.", rule.classLabel);
    return;
  }
  auto cell = rule.cell;
  if (not _rules.emplace(std::move(cell), std::move(rule)).second) {
    utils::ExceptionHandler::exception("RuleSet::addRule: a rule for this grid cell already exists.");
  }
}

double RuleSet::activation(const Rule &rule, const Observation &observation) const {
  double sum = 0.;
  for (size_t feature = 0; feature < _partitions.size(); ++feature) {
    sum += _partitions[feature].fuzzify(rule.membershipFunctions[feature], observation[feature]);
  }
  return sum / static_cast<double>(_partitions.size());
}

std::vector<double> RuleSet::computeActivations(const Observation &observation) const {
  checkObservation(observation);

  std::vector<const Rule *> rules;
  rules.reserve(_rules.size());
  for (const auto &[cell, rule] : _rules) {
    rules.push_back(&rule);
  }

  // read only scan, every iteration writes its own slot
  std::vector<double> activations(rules.size(), 0.);
#ifdef NEUROFIS_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (size_t i = 0; i < rules.size(); ++i) {
    activations[i] = activation(*rules[i], observation);
  }
  return activations;
}

std::optional<RuleSet::Winner> RuleSet::findWinner(const Observation &observation, TieBreakOption tieBreak) const {
  const auto activations = computeActivations(observation);

  std::optional<Winner> winner{};
  double maxActivation = 0.;
  size_t i = 0;
  for (const auto &[cell, rule] : _rules) {
    const double act = activations[i++];
    const bool better = tieBreak == TieBreakOption::firstMaximum ? act > maxActivation : act >= maxActivation;
    if (better) {
      winner = Winner{&rule, act};
      maxActivation = act;
    }
  }
  return winner;
}

ClassLabel RuleSet::classify(const Observation &observation) const {
  const auto winner = findWinner(observation, TieBreakOption::lastMaximum);
  return winner ? winner->rule->classLabel : noClass;
}

std::vector<size_t> RuleSet::activeMembershipFunctions(size_t feature) const {
  if (feature >= _partitions.size()) {
    utils::ExceptionHandler::exception("RuleSet::activeMembershipFunctions: feature {} out of range ({} features).",
                                       feature, _partitions.size());
    return {};
  }
  std::vector<size_t> active;
  for (const auto &[cell, rule] : _rules) {
    const auto membershipFunction = rule.membershipFunctions[feature];
    if (std::find(active.begin(), active.end(), membershipFunction) == active.end()) {
      active.push_back(membershipFunction);
    }
  }
  return active;
}

void RuleSet::checkObservation(const Observation &observation) const {
  if (static_cast<size_t>(observation.size()) != _partitions.size()) {
    utils::ExceptionHandler::exception("RuleSet: observation has {} features but the rule set was built on {}.",
                                       observation.size(), _partitions.size());
  }
}

const fuzzy::FeaturePartition &RuleSet::getPartition(size_t feature) const {
  if (feature >= _partitions.size()) {
    utils::ExceptionHandler::exception("RuleSet::getPartition: feature {} out of range ({} features).", feature,
                                       _partitions.size());
  }
  return _partitions.at(feature);
}

fuzzy::FeaturePartition &RuleSet::getPartition(size_t feature) {
  if (feature >= _partitions.size()) {
    utils::ExceptionHandler::exception("RuleSet::getPartition: feature {} out of range ({} features).", feature,
                                       _partitions.size());
  }
  return _partitions.at(feature);
}

RuleSet::operator std::string() const {
  std::string partitionsStr;
  for (size_t feature = 0; feature < _partitions.size(); ++feature) {
    const auto active = activeMembershipFunctions(feature);
    // a partition without any active function has nothing to show
    if (not active.empty()) {
      partitionsStr += _partitions[feature].toString(active);
    }
  }

  std::string rulesStr = std::accumulate(
      _rules.begin(), _rules.end(), std::string(""), [&](const std::string &acc, const auto &cellAndRule) {
        const auto &rule = cellAndRule.second;
        std::vector<std::string> antecedents;
        for (size_t feature = 0; feature < _partitions.size(); ++feature) {
          antecedents.push_back(
              fmt::format(R"(("{}" == "mf{}"))", _partitions[feature].getName(), rule.membershipFunctions[feature]));
        }
        return acc + fmt::format("if {} then class {} (support {})\n", fmt::join(antecedents, " && "),
                                 rule.classLabel, rule.support);
      });

  return fmt::format("RuleSet: {} features, {} rules\n{}{}", _partitions.size(), _rules.size(), partitionsStr,
                     rulesStr);
}

}  // namespace neurofis::rules
