// SPDX-License-Identifier: MIT

#pragma once
#include "state_vector.hpp"
#include "gates.hpp"
#include <string>
#include <vector>

namespace qrecon {

// PHASE is diag(1, e^{i angle}) on qubits[0]; with one control it is the
// symmetric controlled-phase gate. UNITARY and INIT carry their dense payload
// in `matrix` (row-major for UNITARY, amplitude vector for INIT).
enum class OpType { H, X, RY, PHASE, SWAP, UNITARY, INIT, MEASURE };

struct Op {
  OpType type;
  std::vector<std::size_t> qubits;
  std::vector<std::size_t> controls;
  double angle = 0.0; // for rotations
  vec_c64 matrix;
  std::vector<std::size_t> cbits; // MEASURE destination, parallel to qubits
};

struct Circuit {
  std::size_t nqubits{};
  std::size_t nclbits{};
  std::vector<Op> ops;
};

const char* op_name(OpType t);
bool is_unitary_op(OpType t);

// Apply a single op in place. MEASURE writes into `cbits` (resized to c.nclbits by run).
void apply(const Op& op, StateVector& sv, Rng& rng, std::vector<int>& cbits);

// Execute circuit on an existing state.
void run(const Circuit& c, StateVector& sv, Rng& rng, std::vector<int>& cbits);

struct RunResult {
  std::vector<int> outcome;          // classical bits
  std::vector<double> probabilities; // size 2^n, final state
};

// Execute circuit from |0...0>.
RunResult run(const Circuit& c, uint64_t seed);

} // namespace qrecon
