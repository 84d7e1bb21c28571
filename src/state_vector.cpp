// SPDX-License-Identifier: MIT

#include "qrecon/state_vector.hpp"
#include "qrecon/errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#ifdef QRECON_OPENMP
#include <omp.h>
#endif

namespace qrecon {

StateVector::StateVector(std::size_t n) : n_(n), amp_(std::size_t(1) << n, c64{0.0, 0.0}) {
  amp_[0] = {1.0, 0.0};
}

void StateVector::normalize_() {
  double norm2 = 0.0, c=0.0; for (auto& a : amp_) { double y = std::norm(a) - c; double t = norm2 + y; c = (t - norm2) - y; norm2 = t; }
  double inv = 1.0 / std::sqrt(norm2);
  for (auto& a : amp_) a *= inv;
}

double StateVector::norm() const {
  double s = 0.0;
  for (const auto& a : amp_) s += std::norm(a);
  return std::sqrt(s);
}

void StateVector::check_qubits_(const std::vector<std::size_t>& targets, const std::vector<std::size_t>& controls) const {
  std::vector<std::size_t> all(targets);
  all.insert(all.end(), controls.begin(), controls.end());
  for (auto q : all)
    if (q >= n_) throw ConfigurationMismatch("qubit " + std::to_string(q) + " out of range for " + std::to_string(n_) + "-qubit state");
  std::sort(all.begin(), all.end());
  if (std::adjacent_find(all.begin(), all.end()) != all.end())
    throw ConfigurationMismatch("gate qubits must be distinct");
}

std::size_t StateVector::control_mask_(const std::vector<std::size_t>& controls) const {
  std::size_t m = 0;
  for (auto q : controls) m |= std::size_t(1) << q;
  return m;
}

void StateVector::apply_gate_1q(std::size_t target, const c64 u00, const c64 u01, const c64 u10, const c64 u11) {
  check_qubits_({target}, {});
  const std::size_t N = amp_.size();
  const std::size_t mask = std::size_t(1) << target;
#ifdef QRECON_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    if ((i & mask) == 0) {
      const std::size_t j = i | mask;
      c64 a0 = amp_[i];
      c64 a1 = amp_[j];
      amp_[i] = u00 * a0 + u01 * a1;
      amp_[j] = u10 * a0 + u11 * a1;
    }
  }
  if ((++applied_ & 255) == 0) normalize_();
}

void StateVector::apply_controlled_1q(std::size_t control, std::size_t target, const c64 u00, const c64 u01, const c64 u10, const c64 u11) {
  apply_multi_controlled_1q({control}, target, u00, u01, u10, u11);
}

void StateVector::apply_multi_controlled_1q(const std::vector<std::size_t>& controls, std::size_t target,
                                            const c64 u00, const c64 u01, const c64 u10, const c64 u11) {
  check_qubits_({target}, controls);
  const std::size_t N = amp_.size();
  const std::size_t cm = control_mask_(controls);
  const std::size_t tm = std::size_t(1) << target;
#ifdef QRECON_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    if ((i & cm) == cm && !(i & tm)) {
      const std::size_t j = i | tm;
      c64 a0 = amp_[i];
      c64 a1 = amp_[j];
      amp_[i] = u00 * a0 + u01 * a1;
      amp_[j] = u10 * a0 + u11 * a1;
    }
  }
  if ((++applied_ & 255) == 0) normalize_();
}

void StateVector::apply_swap(std::size_t a, std::size_t b) {
  check_qubits_({a, b}, {});
  const std::size_t N = amp_.size();
  const std::size_t am = std::size_t(1) << a;
  const std::size_t bm = std::size_t(1) << b;
#ifdef QRECON_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    if ((i & am) && !(i & bm)) {
      std::size_t j = (i ^ am) | bm;
      std::swap(amp_[i], amp_[j]);
    }
  }
}

void StateVector::apply_matrix(const std::vector<std::size_t>& targets, const vec_c64& m,
                               const std::vector<std::size_t>& controls) {
  check_qubits_(targets, controls);
  const std::size_t d = std::size_t(1) << targets.size();
  if (m.size() != d * d)
    throw ConfigurationMismatch("matrix of size " + std::to_string(m.size()) + " does not act on " + std::to_string(targets.size()) + " qubits");
  const std::size_t N = amp_.size();
  const std::size_t cm = control_mask_(controls);
  const std::size_t tm = spread_bits(d - 1, targets);
  std::vector<std::size_t> offset(d);
  for (std::size_t s = 0; s < d; ++s) offset[s] = spread_bits(s, targets);
#ifdef QRECON_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    if ((i & tm) || (i & cm) != cm) continue;
    vec_c64 in(d), out(d, c64{0.0, 0.0});
    for (std::size_t s = 0; s < d; ++s) in[s] = amp_[i | offset[s]];
    for (std::size_t r = 0; r < d; ++r)
      for (std::size_t s = 0; s < d; ++s)
        out[r] += m[r*d + s] * in[s];
    for (std::size_t r = 0; r < d; ++r) amp_[i | offset[r]] = out[r];
  }
  if ((++applied_ & 255) == 0) normalize_();
}

void StateVector::initialize(const std::vector<std::size_t>& qubits, const vec_c64& values) {
  check_qubits_(qubits, {});
  const std::size_t d = std::size_t(1) << qubits.size();
  if (values.size() != d)
    throw ConfigurationMismatch("initialization vector has " + std::to_string(values.size()) + " entries, register holds " + std::to_string(d));
  double s = 0.0;
  for (const auto& v : values) s += std::norm(v);
  if (std::fabs(s - 1.0) > 1e-9)
    throw ConfigurationMismatch("initialization vector is not normalized");
  const std::size_t mask = spread_bits(d - 1, qubits);
  for (std::size_t i = 0; i < amp_.size(); ++i)
    if ((i & mask) && std::abs(amp_[i]) > 1e-12)
      throw ConfigurationMismatch("initialized register is not in |0...0>");
  for (std::size_t i = 0; i < amp_.size(); ++i) {
    if (i & mask) continue;
    const c64 a = amp_[i];
    if (a == c64{0.0, 0.0}) continue;
    for (std::size_t k = 0; k < d; ++k) amp_[i | spread_bits(k, qubits)] = a * values[k];
  }
}

double StateVector::probability_of_basis(std::size_t basis_index) const {
  return std::norm(amp_.at(basis_index));
}

std::vector<double> StateVector::probabilities() const {
  std::vector<double> p(amp_.size());
  for (std::size_t i = 0; i < amp_.size(); ++i) p[i] = std::norm(amp_[i]);
  return p;
}

std::vector<int> StateVector::measure(const std::vector<std::size_t>& qubits, Rng& rng) {
  check_qubits_(qubits, {});
  const std::size_t d = std::size_t(1) << qubits.size();
  std::vector<double> p(d, 0.0);
  for (std::size_t i = 0; i < amp_.size(); ++i) p[gather_bits(i, qubits)] += std::norm(amp_[i]);
  // Cumulative distribution
  double r = rng.uniform();
  double acc = 0.0;
  std::size_t outcome = d - 1;
  for (std::size_t k = 0; k < d; ++k) {
    acc += p[k];
    if (r <= acc && p[k] > 0.0) { outcome = k; break; }
  }
  while (p[outcome] == 0.0 && outcome > 0) --outcome;
  const double inv = 1.0 / std::sqrt(p[outcome]);
  for (std::size_t i = 0; i < amp_.size(); ++i) {
    if (gather_bits(i, qubits) == outcome) amp_[i] *= inv;
    else amp_[i] = {0.0, 0.0};
  }
  std::vector<int> bits(qubits.size(), 0);
  for (std::size_t b = 0; b < qubits.size(); ++b) bits[b] = (outcome >> b) & 1;
  return bits;
}

bool StateVector::save(const std::string& path) const {
  struct Header{ char magic[8]; uint32_t version; uint32_t flags; uint64_t n; } h; std::memcpy(h.magic, "QRCSNP1", 8); h.version=1; h.flags=0; h.n=n_;
  std::ofstream out(path, std::ios::binary);
  if (!out) return false;
  out.write(reinterpret_cast<const char*>(&h), sizeof(h));
  out.write(reinterpret_cast<const char*>(amp_.data()), sizeof(c64)*amp_.size());
  return bool(out);
}

std::optional<StateVector> StateVector::load(const std::string& path, std::size_t n_expected){
  struct Header{ char magic[8]; uint32_t version; uint32_t flags; uint64_t n; } h;
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  in.read(reinterpret_cast<char*>(&h), sizeof(h)); if (!in) return std::nullopt; if (std::string(h.magic, h.magic+7) != std::string("QRCSNP1",7)) return std::nullopt; if (h.version!=1) return std::nullopt; if (n_expected && h.n!=n_expected) return std::nullopt; if (h.n > 30) return std::nullopt; StateVector sv((std::size_t)h.n);
  in.read(reinterpret_cast<char*>(sv.amp_.data()), sizeof(c64)*sv.amp_.size());
  if (!in) return std::nullopt;
  sv.normalize_();
  return sv;
}

} // namespace qrecon
