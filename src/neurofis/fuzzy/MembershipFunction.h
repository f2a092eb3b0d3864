/**
 * @file MembershipFunction.h
 * @author M. Reiter
 * @date 14.09.2026
 */

#pragma once

#include <string>

#include "VertexArena.h"

namespace neurofis::fuzzy {

/**
 * Triangular membership function over one feature.
 *
 * The three break points live in a VertexArena and are referenced by id, hence neighboring functions can share a
 * break point. The invariant low <= mid <= high is maintained by the owning FeaturePartition.
 */
class MembershipFunction {
 public:
  /**
   * Constructor.
   * @param low Vertex left of which the membership is 0.
   * @param mid Vertex at which the membership is 1.
   * @param high Vertex right of which the membership is 0.
   */
  MembershipFunction(VertexId low, VertexId mid, VertexId high);

  /**
   * Degree of membership of value.
   * @param arena Storage of the vertices.
   * @param value
   * @return Membership in [0, 1].
   */
  [[nodiscard]] double fuzzify(const VertexArena &arena, double value) const;

  /**
   * Checks whether value lies in the closed interval [low, high].
   * @param arena Storage of the vertices.
   * @param value
   * @return
   */
  [[nodiscard]] bool contains(const VertexArena &arena, double value) const;

  /**
   * Checks low <= mid <= high.
   * @param arena Storage of the vertices.
   * @return
   */
  [[nodiscard]] bool isOrdered(const VertexArena &arena) const;

  /**
   * String representation in the form Triangle(low, mid, high).
   * @param arena Storage of the vertices.
   * @return
   */
  [[nodiscard]] std::string toString(const VertexArena &arena) const;

  /**
   * Getter for the id of the low vertex.
   * @return
   */
  [[nodiscard]] VertexId getLow() const { return _low; }

  /**
   * Getter for the id of the mid vertex.
   * @return
   */
  [[nodiscard]] VertexId getMid() const { return _mid; }

  /**
   * Getter for the id of the high vertex.
   * @return
   */
  [[nodiscard]] VertexId getHigh() const { return _high; }

  /**
   * Rebinds the low vertex.
   * @param low
   */
  void setLow(VertexId low) { _low = low; }

  /**
   * Rebinds the high vertex.
   * @param high
   */
  void setHigh(VertexId high) { _high = high; }

 private:
  VertexId _low;
  VertexId _mid;
  VertexId _high;
};

}  // namespace neurofis::fuzzy
