// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "random.hpp"
#include <optional>

namespace qrecon {

class StateVector {
  std::size_t n_;
  vec_c64 amp_;
  std::size_t applied_ = 0;
  void normalize_();
  void check_qubits_(const std::vector<std::size_t>& targets, const std::vector<std::size_t>& controls) const;
  std::size_t control_mask_(const std::vector<std::size_t>& controls) const;

public:
  explicit StateVector(std::size_t n);
  std::size_t num_qubits() const { return n_; }
  std::size_t dimension() const { return amp_.size(); }
  const vec_c64& amplitudes() const { return amp_; }
  vec_c64& amplitudes_mut() { return amp_; }
  double norm() const;
  bool save(const std::string& path) const;
  static std::optional<StateVector> load(const std::string& path, std::size_t n_expected);

  // Single-qubit 2x2 gate on target qubit (0-indexed, LSB = qubit 0)
  void apply_gate_1q(std::size_t target, const c64 u00, const c64 u01, const c64 u10, const c64 u11);

  // Controlled single-qubit gate with one control (control must be 1).
  void apply_controlled_1q(std::size_t control, std::size_t target, const c64 u00, const c64 u01, const c64 u10, const c64 u11);
  // Applied only on basis states where every control is 1. Empty controls = uncontrolled.
  void apply_multi_controlled_1q(const std::vector<std::size_t>& controls, std::size_t target,
                                 const c64 u00, const c64 u01, const c64 u10, const c64 u11);
  void apply_swap(std::size_t a, std::size_t b);

  // Dense 2^t x 2^t row-major matrix on `targets` (targets[0] = least significant
  // bit of the local index), optionally controlled on every qubit in `controls`.
  void apply_matrix(const std::vector<std::size_t>& targets, const vec_c64& m,
                    const std::vector<std::size_t>& controls = {});

  // Loads `values` into a subregister that is currently |0...0>.
  void initialize(const std::vector<std::size_t>& qubits, const vec_c64& values);

  // Projective measurement of `qubits`; collapses and renormalizes.
  // Returned bits are in the order of `qubits`.
  std::vector<int> measure(const std::vector<std::size_t>& qubits, Rng& rng);
  double probability_of_basis(std::size_t basis_index) const;
  std::vector<double> probabilities() const;
};

// Deposits the bits of `local` onto the qubit positions in `qubits`.
inline std::size_t spread_bits(std::size_t local, const std::vector<std::size_t>& qubits) {
  std::size_t out = 0;
  for (std::size_t b = 0; b < qubits.size(); ++b)
    if ((local >> b) & 1) out |= std::size_t(1) << qubits[b];
  return out;
}

// Inverse of spread_bits: collects the qubits of `index` into a local integer.
inline std::size_t gather_bits(std::size_t index, const std::vector<std::size_t>& qubits) {
  std::size_t out = 0;
  for (std::size_t b = 0; b < qubits.size(); ++b)
    if ((index >> qubits[b]) & 1) out |= std::size_t(1) << b;
  return out;
}

} // namespace qrecon
