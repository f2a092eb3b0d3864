/**
 * @file MembershipFunction.cpp
 * @author M. Reiter
 * @date 14.09.2026
 */

#include "MembershipFunction.h"

#include <fmt/format.h>

namespace neurofis::fuzzy {

MembershipFunction::MembershipFunction(VertexId low, VertexId mid, VertexId high) : _low(low), _mid(mid), _high(high) {}

double MembershipFunction::fuzzify(const VertexArena &arena, double value) const {
  const double low = arena.at(_low);
  const double mid = arena.at(_mid);
  const double high = arena.at(_high);

  if (value < low or value > high) {
    return 0.0;
  } else if (value == mid) {
    return 1.0;
  } else if (value < mid) {
    // mid > low here, so the flank has a positive width
    return (value - low) / (mid - low);
  } else {
    return (high - value) / (high - mid);
  }
}

bool MembershipFunction::contains(const VertexArena &arena, double value) const {
  return arena.at(_low) <= value and value <= arena.at(_high);
}

bool MembershipFunction::isOrdered(const VertexArena &arena) const {
  return arena.at(_low) <= arena.at(_mid) and arena.at(_mid) <= arena.at(_high);
}

std::string MembershipFunction::toString(const VertexArena &arena) const {
  return fmt::format("Triangle({}, {}, {})", arena.at(_low), arena.at(_mid), arena.at(_high));
}

}  // namespace neurofis::fuzzy
