/**
 * @file FeaturePartition.h
 * @author M. Reiter
 * @date 14.09.2026
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "MembershipFunction.h"
#include "VertexArena.h"

namespace neurofis::fuzzy {

/**
 * The linguistic variable of one feature: a set of overlapping triangular membership functions whose break points are
 * shared between neighbors.
 *
 * The default partition places numBreakPoints equally spaced vertices on the observed range [min, max] and creates
 * numMembershipFunctions triangles, triangle n being (points[n], points[n+1], points[n+2]).
 */
class FeaturePartition {
 public:
  /**
   * Number of break points of the default partition.
   */
  static constexpr size_t numBreakPoints{7};

  /**
   * Number of membership functions of the default partition.
   */
  static constexpr size_t numMembershipFunctions{numBreakPoints - 2};

  /**
   * Builds the default partition of the given range.
   * A zero-width range is valid and yields triangles collapsed to a single point.
   * @param name Name of the feature.
   * @param range Observed [min, max] of the feature.
   */
  FeaturePartition(std::string name, std::pair<double, double> range);

  /**
   * Degree of membership of value in the given membership function.
   * @param membershipFunction Index of the membership function.
   * @param value
   * @return
   */
  [[nodiscard]] double fuzzify(size_t membershipFunction, double value) const;

  /**
   * Checks whether value lies in [low, high] of the given membership function.
   * @param membershipFunction Index of the membership function.
   * @param value
   * @return
   */
  [[nodiscard]] bool contains(size_t membershipFunction, double value) const;

  /**
   * Position of the low vertex of a membership function.
   * @param membershipFunction
   * @return
   */
  [[nodiscard]] double lowOf(size_t membershipFunction) const;

  /**
   * Position of the mid vertex of a membership function.
   * @param membershipFunction
   * @return
   */
  [[nodiscard]] double midOf(size_t membershipFunction) const;

  /**
   * Position of the high vertex of a membership function.
   * @param membershipFunction
   * @return
   */
  [[nodiscard]] double highOf(size_t membershipFunction) const;

  /**
   * Closes the gap between a membership function and its right neighbor by rebinding vertices:
   * neighbor.low becomes membershipFunction.mid and membershipFunction.high becomes neighbor.mid.
   * No vertex position changes.
   * @param membershipFunction
   * @param rightNeighbor
   */
  void mergeWithRightNeighbor(size_t membershipFunction, size_t rightNeighbor);

  /**
   * Moves every vertex of a membership function by the distance learningRate towards value or away from it.
   *
   * Moving towards value never overshoots it. A vertex exactly on value is not moved away. Each new position is
   * clamped such that low <= mid <= high stays true for the moved function and all given active functions.
   *
   * @param membershipFunction Index of the function to move.
   * @param value Position to move to or away from.
   * @param learningRate Distance of the shift.
   * @param towards Move towards value if true, away from it otherwise.
   * @param activeFunctions Functions whose ordering has to be preserved.
   */
  void moveMembershipFunction(size_t membershipFunction, double value, double learningRate, bool towards,
                              const std::vector<size_t> &activeFunctions);

  /**
   * Getter for a membership function.
   * @param membershipFunction
   * @return
   */
  [[nodiscard]] const MembershipFunction &getMembershipFunction(size_t membershipFunction) const;

  /**
   * Number of membership functions.
   * @return
   */
  [[nodiscard]] size_t size() const { return _membershipFunctions.size(); }

  /**
   * Getter for the vertex storage.
   * @return
   */
  [[nodiscard]] const VertexArena &getVertices() const { return _vertices; }

  /**
   * Getter for the name of the feature.
   * @return
   */
  [[nodiscard]] const std::string &getName() const { return _name; }

  /**
   * Getter for the range the partition was built on.
   * @return
   */
  [[nodiscard]] const std::pair<double, double> &getRange() const { return _range; }

  /**
   * String representation of the partition and all its membership functions.
   * @param membershipFunctions Indices of the functions to print. All if empty.
   * @return
   */
  [[nodiscard]] std::string toString(const std::vector<size_t> &membershipFunctions = {}) const;

 private:
  /**
   * Moves one vertex to target but not beyond the neighboring vertices of the given functions.
   */
  void moveVertexClamped(VertexId vertex, double target, const std::vector<size_t> &constrainingFunctions);

  const MembershipFunction &checkedAt(size_t membershipFunction) const;

  std::string _name;

  std::pair<double, double> _range;

  VertexArena _vertices;

  std::vector<MembershipFunction> _membershipFunctions;
};

}  // namespace neurofis::fuzzy
