// SPDX-License-Identifier: MIT

#include "qrecon/qft.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace qrecon {

std::size_t bit_reverse(std::size_t x, std::size_t nbits) {
  std::size_t r = 0;
  for (std::size_t b = 0; b < nbits; ++b)
    if ((x >> b) & 1) r |= std::size_t(1) << (nbits - 1 - b);
  return r;
}

std::vector<std::pair<std::size_t, std::size_t>> bit_reversal_pairs(std::size_t n) {
  std::vector<std::pair<std::size_t, std::size_t>> out;
  for (std::size_t i = 0; i < n / 2; ++i) out.emplace_back(i, n - 1 - i);
  return out;
}

std::vector<Op> qft_ops(const std::vector<std::size_t>& qubits) {
  const std::size_t n = qubits.size();
  std::vector<Op> ops;
  for (auto [a, b] : bit_reversal_pairs(n))
    ops.push_back({OpType::SWAP, {qubits[a], qubits[b]}, {}, 0.0, {}, {}});
  for (std::size_t j = 0; j < n; ++j) {
    ops.push_back({OpType::H, {qubits[j]}, {}, 0.0, {}, {}});
    for (std::size_t k = j + 1; k < n; ++k) {
      const double angle = std::numbers::pi / double(std::size_t(1) << (k - j));
      ops.push_back({OpType::PHASE, {qubits[j]}, {qubits[k]}, angle, {}, {}});
    }
  }
  return ops;
}

std::vector<Op> inverse_qft_ops(const std::vector<std::size_t>& qubits) {
  auto ops = qft_ops(qubits);
  std::reverse(ops.begin(), ops.end());
  for (auto& op : ops)
    if (op.type == OpType::PHASE) op.angle = -op.angle;
  return ops;
}

void append_qft(Circuit& c, const std::vector<std::size_t>& qubits) {
  auto ops = qft_ops(qubits);
  c.ops.insert(c.ops.end(), ops.begin(), ops.end());
}

void append_inverse_qft(Circuit& c, const std::vector<std::size_t>& qubits) {
  auto ops = inverse_qft_ops(qubits);
  c.ops.insert(c.ops.end(), ops.begin(), ops.end());
}

} // namespace qrecon
