/**
 * @file VertexArena.cpp
 * @author M. Reiter
 * @date 14.09.2026
 */

#include "VertexArena.h"

#include "neurofis/utils/ExceptionHandler.h"

namespace neurofis::fuzzy {

VertexId VertexArena::add(double position) {
  _positions.push_back(position);
  return _positions.size() - 1;
}

double VertexArena::at(VertexId id) const {
  checkId(id);
  return _positions.at(id);
}

void VertexArena::set(VertexId id, double position) {
  checkId(id);
  _positions.at(id) = position;
}

void VertexArena::checkId(VertexId id) const {
  if (id >= _positions.size()) {
    utils::ExceptionHandler::exception("VertexArena: vertex id {} out of range (size {}).", id, _positions.size());
  }
}

}  // namespace neurofis::fuzzy
