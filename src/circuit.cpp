// SPDX-License-Identifier: MIT

#include "qrecon/circuit.hpp"
#include "qrecon/errors.hpp"

namespace qrecon {

const char* op_name(OpType t) {
  switch (t) {
    case OpType::H: return "H";
    case OpType::X: return "X";
    case OpType::RY: return "RY";
    case OpType::PHASE: return "PHASE";
    case OpType::SWAP: return "SWAP";
    case OpType::UNITARY: return "UNITARY";
    case OpType::INIT: return "INIT";
    case OpType::MEASURE: return "MEASURE";
  }
  return "?";
}

bool is_unitary_op(OpType t) {
  return t != OpType::INIT && t != OpType::MEASURE;
}

void apply(const Op& op, StateVector& sv, Rng& rng, std::vector<int>& cbits) {
  using namespace qrecon::gates;
  c64 u00,u01,u10,u11;
  switch (op.type) {
    case OpType::H:
      H_coeffs(u00,u01,u10,u11);
      sv.apply_multi_controlled_1q(op.controls, op.qubits.at(0), u00,u01,u10,u11);
      break;
    case OpType::X:
      X_coeffs(u00,u01,u10,u11);
      sv.apply_multi_controlled_1q(op.controls, op.qubits.at(0), u00,u01,u10,u11);
      break;
    case OpType::RY:
      RY_coeffs(op.angle, u00,u01,u10,u11);
      sv.apply_multi_controlled_1q(op.controls, op.qubits.at(0), u00,u01,u10,u11);
      break;
    case OpType::PHASE:
      P_coeffs(op.angle, u00,u01,u10,u11);
      sv.apply_multi_controlled_1q(op.controls, op.qubits.at(0), u00,u01,u10,u11);
      break;
    case OpType::SWAP:
      if (!op.controls.empty()) throw ConfigurationMismatch("controlled SWAP is not supported");
      sv.apply_swap(op.qubits.at(0), op.qubits.at(1));
      break;
    case OpType::UNITARY:
      sv.apply_matrix(op.qubits, op.matrix, op.controls);
      break;
    case OpType::INIT:
      sv.initialize(op.qubits, op.matrix);
      break;
    case OpType::MEASURE: {
      if (op.cbits.size() != op.qubits.size()) throw ConfigurationMismatch("MEASURE needs one classical bit per qubit");
      auto bits = sv.measure(op.qubits, rng);
      for (std::size_t k = 0; k < bits.size(); ++k) {
        if (op.cbits[k] >= cbits.size()) throw ConfigurationMismatch("classical bit out of range");
        cbits[op.cbits[k]] = bits[k];
      }
      break;
    }
  }
}

void run(const Circuit& c, StateVector& sv, Rng& rng, std::vector<int>& cbits) {
  if (sv.num_qubits() != c.nqubits)
    throw ConfigurationMismatch("circuit has " + std::to_string(c.nqubits) + " qubits, state has " + std::to_string(sv.num_qubits()));
  if (cbits.size() < c.nclbits) cbits.resize(c.nclbits, 0);
  for (const auto& op : c.ops) apply(op, sv, rng, cbits);
}

RunResult run(const Circuit& c, uint64_t seed) {
  StateVector sv(c.nqubits);
  Rng rng(seed);
  RunResult rr;
  rr.outcome.assign(c.nclbits, 0);
  run(c, sv, rng, rr.outcome);
  rr.probabilities = sv.probabilities();
  return rr;
}

} // namespace qrecon
