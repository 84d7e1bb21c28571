// SPDX-License-Identifier: MIT

#pragma once
#include <complex>
#include <vector>
#include <string>
#include <cstdint>
#include <Eigen/Dense>

namespace qrecon {
  using c64 = std::complex<double>;
  using vec_c64 = std::vector<c64>;

  using RealMatrix = Eigen::MatrixXd;
  using RealVector = Eigen::VectorXd;
  using ComplexMatrix = Eigen::MatrixXcd;
  using ComplexVector = Eigen::VectorXcd;

  // Row-major dense copy of an Eigen matrix, the layout gates are stored in.
  inline vec_c64 to_row_major(const ComplexMatrix& m) {
    vec_c64 out(std::size_t(m.rows() * m.cols()));
    for (Eigen::Index i = 0; i < m.rows(); ++i)
      for (Eigen::Index j = 0; j < m.cols(); ++j)
        out[std::size_t(i * m.cols() + j)] = m(i, j);
    return out;
  }
}
