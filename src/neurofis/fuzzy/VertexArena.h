/**
 * @file VertexArena.h
 * @author M. Reiter
 * @date 14.09.2026
 */

#pragma once

#include <cstddef>
#include <vector>

namespace neurofis::fuzzy {

/**
 * Handle of a vertex inside a VertexArena.
 */
using VertexId = size_t;

/**
 * Storage for the mutable break points of all membership functions of one feature.
 *
 * Membership functions refer to vertices only by their id. Several functions may hold the same id, so moving a vertex
 * is seen by all of them.
 */
class VertexArena {
 public:
  /**
   * Adds a new vertex.
   * @param position
   * @return Id of the new vertex.
   */
  VertexId add(double position);

  /**
   * Position of a vertex.
   * @param id
   * @return
   */
  [[nodiscard]] double at(VertexId id) const;

  /**
   * Moves a vertex.
   * @param id
   * @param position
   */
  void set(VertexId id, double position);

  /**
   * Number of vertices.
   * @return
   */
  [[nodiscard]] size_t size() const { return _positions.size(); }

 private:
  void checkId(VertexId id) const;

  std::vector<double> _positions;
};

}  // namespace neurofis::fuzzy
