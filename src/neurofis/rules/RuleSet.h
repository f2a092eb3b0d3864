/**
 * @file RuleSet.h
 * @author M. Reiter
 * @date 15.09.2026
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "neurofis/DataTypes.h"
#include "neurofis/fuzzy/FeaturePartition.h"
#include "neurofis/options/TieBreakOption.h"
#include "neurofis/rules/Rule.h"

namespace neurofis::rules {

/**
 * The learned state of the classifier: one partition per feature and the rules defined on them.
 *
 * Rules are ordered by their grid cell. This lexicographic order equals the enumeration order of the cartesian
 * product of the partitions and is the order used to break ties.
 */
class RuleSet {
 public:
  /**
   * Result of the search for the most activated rule.
   */
  struct Winner {
    /**
     * The winning rule.
     */
    const Rule *rule;
    /**
     * Its activation.
     */
    double activation;
  };

  /**
   * Constructs an empty rule set without features.
   */
  RuleSet() = default;

  /**
   * Constructs an empty rule set on the given partitions.
   * @param partitions One partition per feature.
   */
  explicit RuleSet(std::vector<fuzzy::FeaturePartition> partitions);

  /**
   * Adds a rule. The rule must reference one existing membership function per feature and its cell must be unique.
   * @param rule
   */
  void addRule(Rule rule);

  /**
   * Mean of the membership degrees of the observation in the antecedents of the rule.
   * @param rule
   * @param observation
   * @return Activation in [0, 1].
   */
  [[nodiscard]] double activation(const Rule &rule, const Observation &observation) const;

  /**
   * Activation of all rules in enumeration order.
   * @param observation
   * @return
   */
  [[nodiscard]] std::vector<double> computeActivations(const Observation &observation) const;

  /**
   * Searches the most activated rule.
   *
   * The running maximum starts at 0. With TieBreakOption::firstMaximum a rule has to be strictly better to replace
   * the current winner, so no rule wins if nothing is activated. With TieBreakOption::lastMaximum greater-or-equal
   * suffices and the last enumerated rule wins among equals.
   *
   * @param observation
   * @param tieBreak
   * @return The winner or std::nullopt.
   */
  [[nodiscard]] std::optional<Winner> findWinner(const Observation &observation, TieBreakOption tieBreak) const;

  /**
   * Class of the most activated rule using TieBreakOption::lastMaximum.
   * @param observation
   * @return Predicted label or noClass if the rule set is empty.
   */
  [[nodiscard]] ClassLabel classify(const Observation &observation) const;

  /**
   * Distinct membership functions of a feature used by at least one rule, in order of first appearance.
   * @param feature
   * @return
   */
  [[nodiscard]] std::vector<size_t> activeMembershipFunctions(size_t feature) const;

  /**
   * Throws if the observation does not have one entry per feature.
   * @param observation
   */
  void checkObservation(const Observation &observation) const;

  /**
   * Getter for the rules.
   * @return
   */
  [[nodiscard]] const std::map<GridCell, Rule> &getRules() const { return _rules; }

  /**
   * Getter for a partition.
   * @param feature
   * @return
   */
  [[nodiscard]] const fuzzy::FeaturePartition &getPartition(size_t feature) const;

  /**
   * Mutable getter for a partition. Used by repair and training.
   * @param feature
   * @return
   */
  fuzzy::FeaturePartition &getPartition(size_t feature);

  /**
   * Number of features.
   * @return
   */
  [[nodiscard]] size_t getNumFeatures() const { return _partitions.size(); }

  /**
   * Number of rules.
   * @return
   */
  [[nodiscard]] size_t size() const { return _rules.size(); }

  /**
   * Checks whether there are no rules.
   * @return
   */
  [[nodiscard]] bool empty() const { return _rules.empty(); }

  /**
   * Human readable listing of the partitions and rules.
   */
  explicit operator std::string() const;

 private:
  std::vector<fuzzy::FeaturePartition> _partitions;

  std::map<GridCell, Rule> _rules;
};

}  // namespace neurofis::rules
