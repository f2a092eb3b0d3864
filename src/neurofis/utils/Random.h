/**
 * @file Random.h
 *
 * @date 19.06.19
 * @author Jan Nguyen
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

namespace neurofis {

/**
 * Class for random algorithms.
 */
class Random : public std::mt19937 {
 public:
  /**
   * Constructor
   * @param seed
   */
  explicit Random(uint64_t seed = std::random_device()()) : std::mt19937(seed) {}

  /**
   * Class should not be copied constructed
   * @param other
   */
  Random(const Random &other) = delete;

  /**
   * Class should not be copied assigned
   * @param other
   * @return
   */
  Random &operator=(const Random &other) = delete;

  /**
   * Random permutation of the indices {0, ..., n-1}.
   * Apply the same permutation to several containers to shuffle them in lockstep.
   * @param n
   * @return shuffled indices
   */
  std::vector<size_t> permutation(size_t n) {
    std::vector<size_t> indices(n);
    std::iota(indices.begin(), indices.end(), 0ul);
    std::shuffle(indices.begin(), indices.end(), *this);
    return indices;
  }
};

}  // namespace neurofis
