// SPDX-License-Identifier: MIT

#pragma once
#include "linear_system.hpp"
#include <vector>

namespace qrecon {

// exp(i A_h s) from the eigendecomposition of A_h.
ComplexMatrix hermitian_exponential(const HermitianSystem& h, double s);

// U_k = exp(i A_h 2^k t0) for k = 0..K-1 and their adjoints, computed once.
class UnitaryEvolutionBank {
  std::vector<ComplexMatrix> forward_;
  std::vector<ComplexMatrix> inverse_;
  std::vector<vec_c64> forward_dense_;
  std::vector<vec_c64> inverse_dense_;
  double max_error_ = 0.0;

public:
  // Throws UnitarityViolation if any U_k deviates from unitary by more than `tolerance`.
  UnitaryEvolutionBank(const HermitianSystem& h, std::size_t clock_qubits, double tolerance = 1e-10);

  std::size_t size() const { return forward_.size(); }
  const ComplexMatrix& forward(std::size_t k) const { return forward_.at(k); }
  const ComplexMatrix& inverse(std::size_t k) const { return inverse_.at(k); }
  // Row-major copies for StateVector::apply_matrix.
  const vec_c64& forward_dense(std::size_t k) const { return forward_dense_.at(k); }
  const vec_c64& inverse_dense(std::size_t k) const { return inverse_dense_.at(k); }
  // Largest max|U^dagger U - I| seen while building.
  double max_unitarity_error() const { return max_error_; }
};

} // namespace qrecon
