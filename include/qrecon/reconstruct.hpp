// SPDX-License-Identifier: MIT

#pragma once
#include "config.hpp"
#include <iosfwd>

namespace qrecon {

struct ReconReport {
  RealMatrix phantom;
  LinearSystem system;
  ArtResult art;
  double art_residual = 0.0;
  HermitianSystem hermitian;
  HhlResult hhl;
  double cosine_similarity = 0.0; // art_recon vs hhl_recon
  double art_nrmse = 0.0;         // vs phantom, both scaled to unit norm
  double hhl_nrmse = 0.0;
};

// x.y / (|x||y|); 0 when either vector is zero.
double cosine_similarity(const RealVector& x, const RealVector& y);
// RMS difference after scaling both to unit norm.
double normalized_rmse(const RealVector& x, const RealVector& reference);

// Projects the configured phantom, runs ART and HHL on the same system.
// Stage progress goes to `log` when non-null.
ReconReport run_reconstruction(const ReconConfig& cfg, std::ostream* log = nullptr);

void write_json(std::ostream& os, const ReconReport& r);

} // namespace qrecon
