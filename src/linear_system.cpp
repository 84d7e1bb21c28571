// SPDX-License-Identifier: MIT

#include "qrecon/linear_system.hpp"
#include "qrecon/errors.hpp"
#include <Eigen/Eigenvalues>
#include <numbers>

namespace qrecon {

void validate(const LinearSystem& sys) {
  if (sys.A.rows() == 0 || sys.A.cols() == 0)
    throw ConfigurationMismatch("projection matrix is empty");
  if (sys.A.rows() != sys.b.size())
    throw ConfigurationMismatch("A has " + std::to_string(sys.A.rows()) + " rows but b has " + std::to_string(sys.b.size()) + " entries");
  if (!sys.A.allFinite() || !sys.b.allFinite())
    throw DegenerateSystem("A or b contains non-finite entries");
}

double residual_norm(const LinearSystem& sys, const RealVector& x) {
  return (sys.A * x - sys.b).norm();
}

HermitianSystem build_hermitian_system(const LinearSystem& sys) {
  validate(sys);
  const Eigen::Index n = sys.A.cols();
  HermitianSystem h;
  h.a_h = sys.A.transpose() * sys.A + RealMatrix::Identity(n, n);
  h.b_h = sys.A.transpose() * sys.b;

  const double bn = h.b_h.norm();
  if (bn == 0.0)
    throw DegenerateSystem("A^T b is the zero vector; nothing to normalize");
  h.b_norm = h.b_h / bn;

  Eigen::SelfAdjointEigenSolver<RealMatrix> es(h.a_h);
  if (es.info() != Eigen::Success)
    throw DegenerateSystem("eigendecomposition of A^T A + I failed");
  h.eigenvalues = es.eigenvalues();
  h.eigenvectors = es.eigenvectors();
  if (h.eigenvalues(0) <= 0.0)
    throw DegenerateSystem("A^T A + I is not positive-definite");

  h.lambda_max = h.eigenvalues(n - 1);
  h.t0 = 2.0 * std::numbers::pi / h.lambda_max;
  return h;
}

} // namespace qrecon
