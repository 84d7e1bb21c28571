// SPDX-License-Identifier: MIT

#include "qrecon/hhl.hpp"
#include "qrecon/errors.hpp"
#include "qrecon/qft.hpp"
#include <cmath>
#include <ostream>
#include <set>

namespace qrecon {

const char* stage_name(Stage s) {
  switch (s) {
    case Stage::Init: return "INIT";
    case Stage::StatePrep: return "STATE_PREP";
    case Stage::PhaseEstimate: return "PHASE_ESTIMATE";
    case Stage::EigenvalueInvert: return "EIGENVALUE_INVERT";
    case Stage::InversePhaseEstimate: return "INV_PHASE_ESTIMATE";
    case Stage::Measure: return "MEASURE";
    case Stage::PostselectExtract: return "POSTSELECT_EXTRACT";
    case Stage::Done: return "DONE";
  }
  return "?";
}

static RegisterLayout checked_layout(const HermitianSystem& h, const HhlOptions& o) {
  const std::size_t n = h.size();
  if (h.b_norm.size() != h.a_h.rows() || h.a_h.rows() != h.a_h.cols())
    throw ConfigurationMismatch("Hermitian system is not square or b_norm has the wrong length");
  auto layout = make_layout(o.clock_qubits, n);
  if (!is_permutation(o.pixel_order, n))
    throw ConfigurationMismatch("pixel order " + format_index_list(o.pixel_order) + " is not a permutation of 0.." + std::to_string(n - 1));
  if (o.reference_index >= n)
    throw ConfigurationMismatch("reference index " + std::to_string(o.reference_index) + " out of range");
  if (o.inversion == InversionMode::Table) validate(o.table, o.clock_qubits);
  return layout;
}

HhlSession::HhlSession(const HermitianSystem& h, HhlOptions opts)
  : h_(h),
    opts_(std::move(opts)),
    layout_(checked_layout(h_, opts_)),
    bank_(h_, opts_.clock_qubits, opts_.unitarity_tolerance),
    table_(opts_.inversion == InversionMode::Grid ? phase_grid_table(opts_.clock_qubits, h_.lambda_max) : opts_.table),
    sv_(layout_.num_qubits()),
    rng_(opts_.seed),
    cbits_(layout_.num_clbits(), 0) {
  program_.nqubits = layout_.num_qubits();
  program_.nclbits = layout_.num_clbits();
}

void HhlSession::advance_(Stage expected, Stage next) {
  if (stage_ != expected)
    throw std::logic_error(std::string("HHL stage ") + stage_name(next) + " called in state " + stage_name(stage_));
  stage_ = next;
}

void HhlSession::emit_(Op op) {
  program_.ops.push_back(std::move(op));
  apply(program_.ops.back(), sv_, rng_, cbits_);
}

void HhlSession::log_stage_(const std::string& msg) const {
  if (log_) *log_ << "[hhl] " << stage_name(stage_) << ": " << msg << "\n";
}

void HhlSession::prepare_state() {
  advance_(Stage::Init, Stage::StatePrep);
  vec_c64 amps(std::size_t(h_.b_norm.size()));
  for (std::size_t i = 0; i < amps.size(); ++i) amps[i] = {h_.b_norm(Eigen::Index(i)), 0.0};
  emit_({OpType::INIT, layout_.system, {}, 0.0, std::move(amps), {}});
  log_stage_("system register loaded with b_norm");
}

void HhlSession::estimate_phase() {
  advance_(Stage::StatePrep, Stage::PhaseEstimate);
  for (auto q : layout_.clock) emit_({OpType::H, {q}, {}, 0.0, {}, {}});
  for (std::size_t k = 0; k < layout_.clock.size(); ++k)
    emit_({OpType::UNITARY, layout_.system, {layout_.clock[k]}, 0.0, bank_.forward_dense(k), {}});
  for (auto& op : inverse_qft_ops(layout_.clock)) emit_(std::move(op));

  const std::size_t K = layout_.clock.size();
  clock_dist_.assign(std::size_t(1) << K, 0.0);
  const auto& a = sv_.amplitudes();
  for (std::size_t i = 0; i < a.size(); ++i) clock_dist_[gather_bits(i, layout_.clock)] += std::norm(a[i]);

  std::set<std::size_t> covered;
  for (const auto& e : table_.entries) covered.insert(pattern_value(e.pattern));
  double uncovered = 0.0;
  for (std::size_t y = 0; y < clock_dist_.size(); ++y)
    if (!covered.count(y)) uncovered += clock_dist_[y];
  log_stage_("probability outside eigenvalue table " + std::to_string(uncovered));
  if (opts_.uncovered == UncoveredPolicy::Error && uncovered > opts_.coverage_tolerance)
    throw FailedPostselection("clock register puts probability " + std::to_string(uncovered) + " on patterns missing from the eigenvalue table");
}

void HhlSession::invert_eigenvalues() {
  advance_(Stage::PhaseEstimate, Stage::EigenvalueInvert);
  const std::size_t K = layout_.clock.size();
  for (const auto& e : table_.entries) {
    std::vector<std::size_t> flips;
    for (std::size_t q = 0; q < K; ++q)
      if (e.pattern[K - 1 - q] == '0') flips.push_back(layout_.clock[q]);
    for (auto q : flips) emit_({OpType::X, {q}, {}, 0.0, {}, {}});
    emit_({OpType::RY, {layout_.ancilla}, layout_.clock, inversion_angle(e.lambda), {}, {}});
    for (auto q : flips) emit_({OpType::X, {q}, {}, 0.0, {}, {}});
  }
  log_stage_(std::to_string(table_.size()) + " controlled rotations");
}

void HhlSession::uncompute_phase() {
  advance_(Stage::EigenvalueInvert, Stage::InversePhaseEstimate);
  for (auto& op : qft_ops(layout_.clock)) emit_(std::move(op));
  for (std::size_t k = layout_.clock.size(); k-- > 0;)
    emit_({OpType::UNITARY, layout_.system, {layout_.clock[k]}, 0.0, bank_.inverse_dense(k), {}});
  log_stage_("clock register uncomputed");
}

void HhlSession::measure() {
  advance_(Stage::InversePhaseEstimate, Stage::Measure);
  std::vector<Op> ops;
  ops.push_back({OpType::MEASURE, {layout_.ancilla}, {}, 0.0, {}, {layout_.ancilla_cbit}});
  if (opts_.measure_system)
    ops.push_back({OpType::MEASURE, layout_.system, {}, 0.0, {}, layout_.system_cbits});

  // Sampling happens on a copy; extraction needs the pre-measurement state.
  StateVector shot = sv_;
  for (auto& op : ops) {
    apply(op, shot, rng_, cbits_);
    program_.ops.push_back(std::move(op));
  }

  if (opts_.shots > 0) {
    std::vector<std::size_t> measured{layout_.ancilla};
    std::vector<std::size_t> targets{layout_.ancilla_cbit};
    if (opts_.measure_system) {
      measured.insert(measured.end(), layout_.system.begin(), layout_.system.end());
      targets.insert(targets.end(), layout_.system_cbits.begin(), layout_.system_cbits.end());
    }
    std::vector<double> p(std::size_t(1) << measured.size(), 0.0);
    const auto& a = sv_.amplitudes();
    for (std::size_t i = 0; i < a.size(); ++i) p[gather_bits(i, measured)] += std::norm(a[i]);
    for (std::size_t s = 0; s < opts_.shots; ++s) {
      double r = rng_.uniform(), acc = 0.0;
      std::size_t k = 0;
      for (; k + 1 < p.size(); ++k) { acc += p[k]; if (r <= acc) break; }
      std::string key(layout_.num_clbits(), '0');
      for (std::size_t b = 0; b < targets.size(); ++b)
        if ((k >> b) & 1) key[layout_.num_clbits() - 1 - targets[b]] = '1';
      counts_[key] += 1;
    }
  }
  log_stage_("ancilla measured " + std::to_string(cbits_[layout_.ancilla_cbit]));
}

HhlResult HhlSession::extract() {
  advance_(Stage::Measure, Stage::PostselectExtract);
  const std::size_t d = layout_.system_dimension();
  const std::size_t anc = std::size_t(1) << layout_.ancilla;
  const std::size_t nclock = std::size_t(1) << layout_.clock.size();
  const auto& a = sv_.amplitudes();

  HhlResult r;
  for (std::size_t i = 0; i < a.size(); ++i)
    if (i & anc) r.success_probability += std::norm(a[i]);

  ComplexVector v = ComplexVector::Zero(Eigen::Index(d));
  for (std::size_t s = 0; s < d; ++s) {
    const std::size_t base = anc | spread_bits(s, layout_.system);
    for (std::size_t c = 0; c < nclock; ++c) v(Eigen::Index(s)) += a[base | spread_bits(c, layout_.clock)];
  }
  const double nv = v.norm();
  if (!(nv > opts_.postselect_tolerance))
    throw FailedPostselection("ancilla = 1 subspace has norm " + std::to_string(nv) + "; eigenvalue table does not cover b");
  v /= nv;

  Eigen::Index ref = Eigen::Index(opts_.reference_index);
  if (std::abs(v(ref)) <= 1e-12) v.cwiseAbs().maxCoeff(&ref);
  v *= std::conj(v(ref)) / std::abs(v(ref));

  r.amplitudes = v;
  r.reference_used = std::size_t(ref);
  r.solution = to_pixel_order(RealVector(v.real()), opts_.pixel_order);
  r.classical_bits = cbits_;
  r.counts = counts_;
  r.clock_distribution = clock_dist_;
  r.gate_count = program_.ops.size();
  log_stage_("P(ancilla=1) = " + std::to_string(r.success_probability));
  stage_ = Stage::Done;
  return r;
}

HhlResult HhlSession::run() {
  prepare_state();
  estimate_phase();
  invert_eigenvalues();
  uncompute_phase();
  measure();
  return extract();
}

HhlResult hhl_solve(const LinearSystem& sys, const HhlOptions& opts) {
  HhlSession session(build_hermitian_system(sys), opts);
  return session.run();
}

} // namespace qrecon
