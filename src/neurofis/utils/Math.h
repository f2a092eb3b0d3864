/**
 * @file Math.h
 * @author Jan Nguyen
 * @date 18.08.19
 */

#pragma once

#include <Eigen/Core>
#include <cmath>
#include <limits>
#include <type_traits>
#include <vector>

namespace neurofis::utils::Math {

/**
 * Multiplication function for integer types that is safe against over and underflow.
 * If over or underflow is detected, the function returns the specified values.
 * @tparam T
 * @param a
 * @param b
 * @param valUnderflow Return value in case of underflow.
 * @param valOverflow Return value in case of overflow.
 * @return Product or valUnderflow or valOverflow.
 */
template <class T, std::enable_if_t<std::is_integral_v<T>, bool> = true>
T safeMul(const T &a, const T &b, const T &valUnderflow = std::numeric_limits<T>::min(),
          const T &valOverflow = std::numeric_limits<T>::max()) {
  T result;
  bool overflow = __builtin_mul_overflow(a, b, &result);
  if (overflow) {
    // if exactly one arg is negative this is an underflow.
    if (a < 0 xor b < 0) {
      result = valUnderflow;
    } else {
      result = valOverflow;
    }
  }
  return result;
}

/**
 * Create a vector of doubles from given elements
 * @param elements
 * @return
 */
Eigen::VectorXd makeVectorXd(const std::vector<double> &elements);

/**
 * Create a row major matrix of doubles from given rows.
 * All rows are expected to have the same length.
 * @param rows
 * @return
 */
Eigen::MatrixXd makeMatrixXd(const std::vector<std::vector<double>> &rows);

}  // namespace neurofis::utils::Math
