/**
 * @file FeaturePartition.cpp
 * @author M. Reiter
 * @date 14.09.2026
 */

#include "FeaturePartition.h"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numeric>

#include "neurofis/utils/ExceptionHandler.h"

namespace neurofis::fuzzy {

FeaturePartition::FeaturePartition(std::string name, std::pair<double, double> range)
    : _name(std::move(name)), _range(range) {
  const auto [min, max] = _range;
  if (not std::isfinite(min) or not std::isfinite(max) or min > max) {
    utils::ExceptionHandler::exception("FeaturePartition {}: invalid range ({}, {}).", _name, min, max);
  }

  // equally spaced break points on the closed range. For min == max the step is 0 and all points coincide.
  const double step = (max - min) / static_cast<double>(numBreakPoints - 1);
  std::array<VertexId, numBreakPoints> points{};
  for (size_t n = 0; n < numBreakPoints; ++n) {
    // pin the last point to max to avoid rounding below the observed maximum
    points[n] = _vertices.add(n == numBreakPoints - 1 ? max : min + static_cast<double>(n) * step);
  }

  _membershipFunctions.reserve(numMembershipFunctions);
  for (size_t n = 0; n < numMembershipFunctions; ++n) {
    _membershipFunctions.emplace_back(points[n], points[n + 1], points[n + 2]);
  }
}

double FeaturePartition::fuzzify(size_t membershipFunction, double value) const {
  return checkedAt(membershipFunction).fuzzify(_vertices, value);
}

bool FeaturePartition::contains(size_t membershipFunction, double value) const {
  return checkedAt(membershipFunction).contains(_vertices, value);
}

double FeaturePartition::lowOf(size_t membershipFunction) const {
  return _vertices.at(checkedAt(membershipFunction).getLow());
}

double FeaturePartition::midOf(size_t membershipFunction) const {
  return _vertices.at(checkedAt(membershipFunction).getMid());
}

double FeaturePartition::highOf(size_t membershipFunction) const {
  return _vertices.at(checkedAt(membershipFunction).getHigh());
}

void FeaturePartition::mergeWithRightNeighbor(size_t membershipFunction, size_t rightNeighbor) {
  if (membershipFunction == rightNeighbor) {
    utils::ExceptionHandler::exception("FeaturePartition {}: membership function {} cannot be its own neighbor.", _name,
                                       membershipFunction);
    return;
  }
  checkedAt(membershipFunction);
  checkedAt(rightNeighbor);
  auto &left = _membershipFunctions[membershipFunction];
  auto &right = _membershipFunctions[rightNeighbor];
  right.setLow(left.getMid());
  left.setHigh(right.getMid());
}

void FeaturePartition::moveMembershipFunction(size_t membershipFunction, double value, double learningRate,
                                              bool towards, const std::vector<size_t> &activeFunctions) {
  const auto &function = checkedAt(membershipFunction);

  std::vector<size_t> constrainingFunctions(activeFunctions);
  if (std::find(constrainingFunctions.begin(), constrainingFunctions.end(), membershipFunction) ==
      constrainingFunctions.end()) {
    constrainingFunctions.push_back(membershipFunction);
  }

  // mid first so that low and high are clamped against its new position
  const std::array<VertexId, 3> vertices{function.getMid(), function.getLow(), function.getHigh()};
  for (size_t i = 0; i < vertices.size(); ++i) {
    const auto vertex = vertices[i];
    if (std::find(vertices.begin(), vertices.begin() + i, vertex) != vertices.begin() + i) {
      continue;
    }
    const double position = _vertices.at(vertex);
    const double distance = value - position;
    double target = position;
    if (towards) {
      target = position + std::copysign(std::min(learningRate, std::abs(distance)), distance);
    } else if (distance != 0.) {
      target = position - std::copysign(learningRate, distance);
    }
    moveVertexClamped(vertex, target, constrainingFunctions);
  }
}

void FeaturePartition::moveVertexClamped(VertexId vertex, double target,
                                         const std::vector<size_t> &constrainingFunctions) {
  double lowerBound = std::numeric_limits<double>::lowest();
  double upperBound = std::numeric_limits<double>::max();
  for (const auto index : constrainingFunctions) {
    const auto &function = checkedAt(index);
    if (function.getLow() == vertex) {
      upperBound = std::min(upperBound, _vertices.at(function.getMid()));
    }
    if (function.getMid() == vertex) {
      lowerBound = std::max(lowerBound, _vertices.at(function.getLow()));
      upperBound = std::min(upperBound, _vertices.at(function.getHigh()));
    }
    if (function.getHigh() == vertex) {
      lowerBound = std::max(lowerBound, _vertices.at(function.getMid()));
    }
  }
  _vertices.set(vertex, std::clamp(target, lowerBound, upperBound));
}

const MembershipFunction &FeaturePartition::getMembershipFunction(size_t membershipFunction) const {
  return checkedAt(membershipFunction);
}

const MembershipFunction &FeaturePartition::checkedAt(size_t membershipFunction) const {
  if (membershipFunction >= _membershipFunctions.size()) {
    utils::ExceptionHandler::exception("FeaturePartition {}: membership function {} out of range (size {}).", _name,
                                       membershipFunction, _membershipFunctions.size());
  }
  return _membershipFunctions.at(membershipFunction);
}

std::string FeaturePartition::toString(const std::vector<size_t> &membershipFunctions) const {
  std::vector<size_t> indices(membershipFunctions);
  if (indices.empty()) {
    indices.resize(_membershipFunctions.size());
    std::iota(indices.begin(), indices.end(), 0ul);
  }

  std::string termsStr = std::accumulate(indices.begin(), indices.end(), std::string(""),
                                         [&](const std::string &acc, size_t index) {
                                           return acc + fmt::format("\t\"mf{}\": {}\n", index,
                                                                    checkedAt(index).toString(_vertices));
                                         });

  return fmt::format("FeaturePartition: domain: \"{}\" range: ({}, {})\n{}", _name, _range.first, _range.second,
                     termsStr);
}

}  // namespace neurofis::fuzzy
