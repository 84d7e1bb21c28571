// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"

namespace qrecon {

// A (m x n) and b (length m). Immutable once built.
struct LinearSystem {
  RealMatrix A;
  RealVector b;

  std::size_t rows() const { return std::size_t(A.rows()); }
  std::size_t cols() const { return std::size_t(A.cols()); }
};

// Throws ConfigurationMismatch on shape mismatch, DegenerateSystem on
// non-finite entries.
void validate(const LinearSystem& sys);

// ||A x - b||_2
double residual_norm(const LinearSystem& sys, const RealVector& x);

// A_h = A^T A + I, b_h = A^T b, b_norm = b_h / ||b_h||.
struct HermitianSystem {
  RealMatrix a_h;
  RealVector b_h;
  RealVector b_norm;
  RealVector eigenvalues;   // ascending
  RealMatrix eigenvectors;  // columns, orthonormal
  double lambda_max = 0.0;
  double t0 = 0.0;          // 2 pi / lambda_max

  std::size_t size() const { return std::size_t(a_h.rows()); }
};

HermitianSystem build_hermitian_system(const LinearSystem& sys);

} // namespace qrecon
