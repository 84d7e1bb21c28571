// SPDX-License-Identifier: MIT

#include "qrecon/reconstruct.hpp"
#include <cmath>
#include <ostream>

namespace qrecon {

double cosine_similarity(const RealVector& x, const RealVector& y) {
  const double d = x.norm() * y.norm();
  return d > 0.0 ? x.dot(y) / d : 0.0;
}

double normalized_rmse(const RealVector& x, const RealVector& reference) {
  if (x.size() == 0 || x.norm() == 0.0 || reference.norm() == 0.0) return 0.0;
  const RealVector diff = x / x.norm() - reference / reference.norm();
  return diff.norm() / std::sqrt(double(x.size()));
}

ReconReport run_reconstruction(const ReconConfig& cfg, std::ostream* log) {
  ReconReport r;
  r.phantom = cfg.phantom;
  r.system = project(cfg.phantom, cfg.projection);
  if (log) *log << "[source] A is " << r.system.rows() << "x" << r.system.cols() << "\n";

  r.art = art_solve(r.system, cfg.art);
  r.art_residual = residual_norm(r.system, r.art.x);
  if (log) *log << "[art] " << cfg.art.iterations << " sweeps, residual " << r.art_residual << "\n";

  r.hermitian = build_hermitian_system(r.system);
  if (log) *log << "[hermitian] lambda_max " << r.hermitian.lambda_max << ", t0 " << r.hermitian.t0 << "\n";
  HhlSession session(r.hermitian, cfg.hhl);
  session.set_log(log);
  r.hhl = session.run();

  const RealVector truth = flatten(cfg.phantom);
  r.cosine_similarity = cosine_similarity(r.art.x, r.hhl.solution);
  r.art_nrmse = normalized_rmse(r.art.x, truth);
  r.hhl_nrmse = normalized_rmse(r.hhl.solution, truth);
  return r;
}

template <typename Vec>
static void write_array(std::ostream& os, const Vec& v) {
  os << "[";
  for (Eigen::Index i = 0; i < Eigen::Index(v.size()); ++i) { os << v[i]; if (i + 1 < Eigen::Index(v.size())) os << ", "; }
  os << "]";
}

static void write_matrix(std::ostream& os, const RealMatrix& m, const char* indent) {
  os << "[\n";
  for (Eigen::Index i = 0; i < m.rows(); ++i) {
    os << indent << "  ";
    write_array(os, RealVector(m.row(i).transpose()));
    os << (i + 1 < m.rows() ? "," : "") << "\n";
  }
  os << indent << "]";
}

void write_json(std::ostream& os, const ReconReport& r) {
  os << "{\n  \"phantom\": ";
  write_matrix(os, r.phantom, "  ");
  os << ",\n  \"A\": ";
  write_matrix(os, r.system.A, "  ");
  os << ",\n  \"b\": "; write_array(os, r.system.b);
  os << ",\n  \"art_recon\": "; write_array(os, r.art.x);
  os << ",\n  \"art_residual\": " << r.art_residual;
  if (!r.art.residuals.empty()) { os << ",\n  \"art_residual_history\": "; write_array(os, r.art.residuals); }
  os << ",\n  \"eigenvalues\": "; write_array(os, r.hermitian.eigenvalues);
  os << ",\n  \"t0\": " << r.hermitian.t0;
  os << ",\n  \"hhl_recon\": "; write_array(os, r.hhl.solution);
  os << ",\n  \"hhl_amplitudes\": [";
  for (Eigen::Index i = 0; i < r.hhl.amplitudes.size(); ++i) {
    os << "[" << r.hhl.amplitudes(i).real() << ", " << r.hhl.amplitudes(i).imag() << "]";
    if (i + 1 < r.hhl.amplitudes.size()) os << ", ";
  }
  os << "]";
  os << ",\n  \"reference_index\": " << r.hhl.reference_used;
  os << ",\n  \"success_probability\": " << r.hhl.success_probability;
  os << ",\n  \"classical_bits\": "; write_array(os, r.hhl.classical_bits);
  os << ",\n  \"counts\": {";
  std::size_t k = 0;
  for (const auto& [key, n] : r.hhl.counts) { os << (k++ ? ", " : "") << "\"" << key << "\": " << n; }
  os << "}";
  os << ",\n  \"gate_count\": " << r.hhl.gate_count;
  os << ",\n  \"cosine_similarity\": " << r.cosine_similarity;
  os << ",\n  \"art_nrmse\": " << r.art_nrmse;
  os << ",\n  \"hhl_nrmse\": " << r.hhl_nrmse;
  os << "\n}\n";
}

} // namespace qrecon
