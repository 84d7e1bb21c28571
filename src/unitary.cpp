// SPDX-License-Identifier: MIT

#include "qrecon/unitary.hpp"
#include "qrecon/errors.hpp"
#include <algorithm>
#include <cmath>

namespace qrecon {

static std::vector<c64> eye(std::size_t d){
  std::vector<c64> m(d*d, {0.0,0.0});
  for (std::size_t i=0;i<d;i++) m[i*d+i] = {1.0,0.0};
  return m;
}

static std::vector<c64> matmul(const std::vector<c64>& A, const std::vector<c64>& B, std::size_t d){
  std::vector<c64> C(d*d, {0.0,0.0});
  for (std::size_t i=0;i<d;i++)
    for (std::size_t k=0;k<d;k++){
      auto aik = A[i*d+k];
      for (std::size_t j=0;j<d;j++)
        C[i*d+j] += aik * B[k*d+j];
    }
  return C;
}

std::vector<c64> build_unitary(const Circuit& c){
  // Validate
  for (auto& op: c.ops){
    if (!is_unitary_op(op.type))
      throw ConfigurationMismatch(std::string("Non-unitary op present: ") + op_name(op.type));
  }
  std::size_t n = c.nqubits;
  if (n > 12) throw ConfigurationMismatch("build_unitary limited to 12 qubits");
  std::size_t d = std::size_t(1) << n;
  std::vector<c64> U(d*d, {0.0,0.0});
  Rng rng(0);
  std::vector<int> cbits;
  for (std::size_t x=0;x<d;x++){
    StateVector sv(n);
    auto& a = sv.amplitudes_mut();
    a[0] = {0.0,0.0}; a[x] = {1.0,0.0};
    run(c, sv, rng, cbits);
    for (std::size_t y=0;y<d;y++) U[y*d+x] = sv.amplitudes()[y];
  }
  return U;
}

std::vector<c64> adjoint(const std::vector<c64>& U, std::size_t d){
  std::vector<c64> A(d*d);
  for (std::size_t i=0;i<d;i++)
    for (std::size_t j=0;j<d;j++)
      A[j*d+i] = std::conj(U[i*d+j]);
  return A;
}

double unitarity_error(const std::vector<c64>& U, std::size_t d){
  if (U.size() != d*d) throw ConfigurationMismatch("matrix is not " + std::to_string(d) + "x" + std::to_string(d));
  auto P = matmul(adjoint(U, d), U, d);
  auto I = eye(d);
  double err = 0.0;
  for (std::size_t i=0;i<d*d;i++) err = std::max(err, std::abs(P[i] - I[i]));
  return err;
}

} // namespace qrecon
