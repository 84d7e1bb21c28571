// SPDX-License-Identifier: MIT

#include "qrecon/projection.hpp"
#include "qrecon/errors.hpp"
#include <cmath>

namespace qrecon {

RealMatrix reference_phantom() {
  RealMatrix p(2, 2);
  p << 1.0, 2.0,
       3.0, 4.0;
  return p;
}

RealMatrix projection_matrix(std::size_t side, const ProjectionOptions& opts) {
  if (side == 0) throw ConfigurationMismatch("image side must be positive");
  if (opts.angles_deg.empty()) throw ConfigurationMismatch("at least one projection angle is required");
  const Eigen::Index s = Eigen::Index(side);
  RealMatrix A = RealMatrix::Zero(Eigen::Index(opts.angles_deg.size()) * s, s * s);
  Eigen::Index row = 0;
  for (double ang : opts.angles_deg) {
    const double a = std::fmod(std::fmod(ang, 180.0) + 180.0, 180.0);
    for (Eigen::Index d = 0; d < s; ++d, ++row) {
      for (Eigen::Index k = 0; k < s; ++k) {
        if (a == 0.0) A(row, k * s + d) = 1.0;
        else if (a == 90.0) A(row, d * s + k) = 1.0;
        else throw ConfigurationMismatch("projection angle " + std::to_string(ang) + " is not supported on a pixel grid");
      }
      if (opts.normalize_rows) A.row(row).normalize();
    }
  }
  return A;
}

LinearSystem project(const RealMatrix& phantom, const ProjectionOptions& opts) {
  if (phantom.rows() != phantom.cols())
    throw ConfigurationMismatch("phantom must be square");
  LinearSystem sys;
  sys.A = projection_matrix(std::size_t(phantom.rows()), opts);
  sys.b = sys.A * flatten(phantom);
  return sys;
}

RealVector flatten(const RealMatrix& image) {
  RealVector v(image.size());
  for (Eigen::Index r = 0; r < image.rows(); ++r)
    for (Eigen::Index c = 0; c < image.cols(); ++c)
      v(r * image.cols() + c) = image(r, c);
  return v;
}

RealMatrix unflatten(const RealVector& v, std::size_t side) {
  const Eigen::Index s = Eigen::Index(side);
  if (v.size() != s * s) throw ConfigurationMismatch("vector does not fill a " + std::to_string(side) + "x" + std::to_string(side) + " image");
  RealMatrix m(s, s);
  for (Eigen::Index r = 0; r < s; ++r)
    for (Eigen::Index c = 0; c < s; ++c)
      m(r, c) = v(r * s + c);
  return m;
}

} // namespace qrecon
