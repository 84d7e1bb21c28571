// SPDX-License-Identifier: MIT

#include "qrecon/art.hpp"
#include "qrecon/errors.hpp"

namespace qrecon {

ArtResult art_solve(const LinearSystem& sys, const ArtOptions& opts) {
  validate(sys);
  if (opts.iterations < 1)
    throw ConfigurationMismatch("ART needs at least one iteration");
  if (!(opts.relaxation > 0.0 && opts.relaxation <= 2.0))
    throw ConfigurationMismatch("ART relaxation must lie in (0, 2]");

  const Eigen::Index m = sys.A.rows();
  RealVector row_norm2(m);
  for (Eigen::Index i = 0; i < m; ++i) row_norm2(i) = sys.A.row(i).squaredNorm();

  ArtResult res;
  res.x = RealVector::Zero(sys.A.cols());
  for (std::size_t it = 0; it < opts.iterations; ++it) {
    for (Eigen::Index i = 0; i < m; ++i) {
      if (row_norm2(i) <= 0.0) continue;
      const double r = sys.b(i) - sys.A.row(i).dot(res.x);
      res.x += (opts.relaxation * r / row_norm2(i)) * sys.A.row(i).transpose();
    }
    if (opts.record_residuals) res.residuals.push_back(residual_norm(sys, res.x));
  }
  return res;
}

} // namespace qrecon
