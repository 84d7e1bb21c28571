// SPDX-License-Identifier: MIT

#include "qrecon/evolution.hpp"
#include "qrecon/errors.hpp"
#include <algorithm>
#include <cmath>

namespace qrecon {

ComplexMatrix hermitian_exponential(const HermitianSystem& h, double s) {
  const Eigen::Index n = h.a_h.rows();
  ComplexVector phases(n);
  for (Eigen::Index i = 0; i < n; ++i) phases(i) = std::polar(1.0, h.eigenvalues(i) * s);
  const ComplexMatrix V = h.eigenvectors.cast<c64>();
  return V * phases.asDiagonal() * V.adjoint();
}

UnitaryEvolutionBank::UnitaryEvolutionBank(const HermitianSystem& h, std::size_t clock_qubits, double tolerance) {
  if (clock_qubits == 0 || clock_qubits > 30)
    throw ConfigurationMismatch("clock register must have between 1 and 30 qubits");
  const Eigen::Index n = h.a_h.rows();
  if (h.eigenvectors.rows() != n || h.eigenvalues.size() != n)
    throw ConfigurationMismatch("Hermitian system carries no eigendecomposition");
  const ComplexMatrix I = ComplexMatrix::Identity(n, n);
  for (std::size_t k = 0; k < clock_qubits; ++k) {
    const double s = std::ldexp(h.t0, int(k));
    ComplexMatrix U = hermitian_exponential(h, s);
    const double err = (U.adjoint() * U - I).cwiseAbs().maxCoeff();
    max_error_ = std::max(max_error_, err);
    if (!(err <= tolerance))
      throw UnitarityViolation("exp(i A_h 2^" + std::to_string(k) + " t0) deviates from unitary by " + std::to_string(err));
    ComplexMatrix Ui = U.adjoint();
    forward_dense_.push_back(to_row_major(U));
    inverse_dense_.push_back(to_row_major(Ui));
    forward_.push_back(std::move(U));
    inverse_.push_back(std::move(Ui));
  }
}

} // namespace qrecon
