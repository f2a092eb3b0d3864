/**
 * @file Math.cpp
 * @author Jan Nguyen
 * @date 18.08.19
 */

#include "Math.h"

#include "neurofis/utils/ExceptionHandler.h"

namespace neurofis::utils::Math {

Eigen::VectorXd makeVectorXd(const std::vector<double> &elements) {
  return Eigen::Map<const Eigen::VectorXd>(elements.data(), elements.size());
}

Eigen::MatrixXd makeMatrixXd(const std::vector<std::vector<double>> &rows) {
  const auto numCols = rows.empty() ? 0 : rows.front().size();
  Eigen::MatrixXd matrix(rows.size(), numCols);
  for (size_t row = 0; row < rows.size(); ++row) {
    if (rows[row].size() != numCols) {
      ExceptionHandler::exception("Math::makeMatrixXd: row {} has {} entries but {} were expected.", row,
                                  rows[row].size(), numCols);
      return Eigen::MatrixXd{};
    }
    matrix.row(row) = Eigen::Map<const Eigen::RowVectorXd>(rows[row].data(), numCols);
  }
  return matrix;
}

}  // namespace neurofis::utils::Math
