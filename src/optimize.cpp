// SPDX-License-Identifier: MIT

#include "qrecon/optimize.hpp"
#include <algorithm>
#include <cmath>

namespace qrecon {

static bool is_involutory(OpType t){
  return t==OpType::X || t==OpType::H || t==OpType::SWAP;
}

static bool is_rotation(OpType t){
  return t==OpType::RY || t==OpType::PHASE;
}

static std::vector<std::size_t> support(const Op& op){
  std::vector<std::size_t> s(op.qubits);
  s.insert(s.end(), op.controls.begin(), op.controls.end());
  return s;
}

static bool touches(const Op& a, const Op& b){
  auto sa = support(a);
  for (auto q : support(b))
    if (std::find(sa.begin(), sa.end(), q) != sa.end()) return true;
  return false;
}

static bool same_slot(const Op& a, const Op& b){
  if (a.type != b.type) return false;
  auto qa = a.qubits, qb = b.qubits, ca = a.controls, cb = b.controls;
  if (a.type == OpType::SWAP) { std::sort(qa.begin(), qa.end()); std::sort(qb.begin(), qb.end()); }
  std::sort(ca.begin(), ca.end()); std::sort(cb.begin(), cb.end());
  return qa == qb && ca == cb;
}

Circuit optimize(const Circuit& in, OptimizeOptions opts){
  Circuit out; out.nqubits = in.nqubits; out.nclbits = in.nclbits;
  out.ops.reserve(in.ops.size());
  for (const auto& op : in.ops){
    if (opts.drop_identity && is_rotation(op.type) && std::fabs(op.angle) < 1e-15) continue;
    std::size_t j = out.ops.size();
    while (j > 0 && !touches(out.ops[j-1], op)) --j;
    if (j > 0 && same_slot(out.ops[j-1], op)){
      auto& prev = out.ops[j-1];
      if (opts.cancel_involutory && is_involutory(op.type)){
        out.ops.erase(out.ops.begin() + std::ptrdiff_t(j-1));
        continue;
      }
      if (opts.merge_rotations && is_rotation(op.type)){
        prev.angle += op.angle;
        if (opts.drop_identity && std::fabs(prev.angle) < 1e-15) out.ops.erase(out.ops.begin() + std::ptrdiff_t(j-1));
        continue;
      }
    }
    out.ops.push_back(op);
  }
  return out;
}

CircuitStats circuit_stats(const Circuit& c){
  CircuitStats s;
  for (const auto& op : c.ops){
    ++s.total;
    ++s.by_type[static_cast<std::size_t>(op.type)];
    s.max_controls = std::max(s.max_controls, op.controls.size());
  }
  return s;
}

} // namespace qrecon
