// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include <vector>

namespace qrecon {

// Build full unitary matrix (2^n x 2^n) of a circuit. Column x is the circuit
// applied to basis state |x>. Fails if INIT or MEASURE present.
// Returns row-major vector of complex numbers (size d*d).
std::vector<c64> build_unitary(const Circuit& c);

// Conjugate transpose of a row-major d x d matrix.
std::vector<c64> adjoint(const std::vector<c64>& U, std::size_t d);

// max |(U^dagger U - I)_ij|
double unitarity_error(const std::vector<c64>& U, std::size_t d);

} // namespace qrecon
