/**
 * @file Rule.h
 * @author M. Reiter
 * @date 15.09.2026
 */

#pragma once

#include <cstddef>
#include <vector>

#include "neurofis/DataTypes.h"

namespace neurofis::rules {

/**
 * Coordinate of a grid cell: one membership function index per feature. Serves as the stable identity of a rule.
 */
using GridCell = std::vector<size_t>;

/**
 * A fuzzy rule of the form: IF feature_0 IS mf_0 AND ... AND feature_n IS mf_n THEN classLabel.
 */
struct Rule {
  /**
   * Grid cell this rule was induced from.
   */
  GridCell cell;

  /**
   * Index of the antecedent membership function in the partition of each feature.
   * Equal to cell after induction.
   */
  std::vector<size_t> membershipFunctions;

  /**
   * Consequent.
   */
  ClassLabel classLabel{noClass};

  /**
   * Number of induction observations of classLabel inside the cell.
   */
  size_t support{0};
};

}  // namespace neurofis::rules
