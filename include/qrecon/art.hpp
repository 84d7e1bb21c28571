// SPDX-License-Identifier: MIT

#pragma once
#include "linear_system.hpp"
#include <vector>

namespace qrecon {

struct ArtOptions {
  std::size_t iterations = 10;  // full sweeps over the rows
  double relaxation = 1.0;      // in (0, 2]
  bool record_residuals = false;
};

struct ArtResult {
  RealVector x;
  std::vector<double> residuals; // ||Ax-b|| after each sweep, if recorded
};

// Kaczmarz row-relaxation from x = 0, rows in ascending order.
// Zero-norm rows are skipped.
ArtResult art_solve(const LinearSystem& sys, const ArtOptions& opts = {});

} // namespace qrecon
