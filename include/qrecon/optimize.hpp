// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include <utility>

namespace qrecon {

struct OptimizeOptions {
  bool cancel_involutory = true; // X^2=I, H^2=I, SWAP^2=I with equal controls
  bool merge_rotations = true;   // RY/PHASE on same target and controls sum angles
  bool drop_identity = true;     // zero-angle RY/PHASE
};

// Peephole pass. A gate is paired with the most recent earlier gate that
// shares any qubit with it; gates on disjoint qubits commute past each other.
Circuit optimize(const Circuit& in, OptimizeOptions opts = {});

struct CircuitStats {
  std::size_t total = 0;
  std::size_t max_controls = 0;
  std::size_t by_type[8] = {};
};

CircuitStats circuit_stats(const Circuit& c);

} // namespace qrecon
