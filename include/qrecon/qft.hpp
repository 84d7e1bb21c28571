// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include <utility>
#include <vector>

namespace qrecon {

// Reverses the low `nbits` bits of x (bit 0 <-> bit nbits-1).
std::size_t bit_reverse(std::size_t x, std::size_t nbits);

// Positions (i, n-1-i) swapped by the bit-reversal stage of an n-qubit QFT.
std::vector<std::pair<std::size_t, std::size_t>> bit_reversal_pairs(std::size_t n);

// QFT over `qubits` (qubits[0] least significant):
//   bit-reversal swaps, then for j ascending H(j) and controlled phase
//   pi/2^(k-j) from every k > j.
// Maps |x> to 2^{-n/2} sum_y e^{2 pi i x y / 2^n} |y>.
std::vector<Op> qft_ops(const std::vector<std::size_t>& qubits);

// Exact adjoint of qft_ops: reversed order, negated phases, swaps last.
std::vector<Op> inverse_qft_ops(const std::vector<std::size_t>& qubits);

void append_qft(Circuit& c, const std::vector<std::size_t>& qubits);
void append_inverse_qft(Circuit& c, const std::vector<std::size_t>& qubits);

} // namespace qrecon
