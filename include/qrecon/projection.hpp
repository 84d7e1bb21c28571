// SPDX-License-Identifier: MIT

#pragma once
#include "linear_system.hpp"
#include <vector>

namespace qrecon {

struct ProjectionOptions {
  std::vector<double> angles_deg = {0.0, 90.0};
  bool normalize_rows = false; // scale each row (and b_i) to unit L2 norm
};

// [[1,2],[3,4]]
RealMatrix reference_phantom();

// Indicator projection matrix for a square grid, pixels flattened row-major.
// 0 deg rays run down columns (detector d sums column d), 90 deg rays run
// along rows (detector d sums row d). Other angles are not supported.
RealMatrix projection_matrix(std::size_t side, const ProjectionOptions& opts = {});

// A from projection_matrix and b = A * phantom (flattened row-major).
LinearSystem project(const RealMatrix& phantom, const ProjectionOptions& opts = {});

// Row-major flatten and its inverse.
RealVector flatten(const RealMatrix& image);
RealMatrix unflatten(const RealVector& v, std::size_t side);

} // namespace qrecon
