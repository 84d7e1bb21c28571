// SPDX-License-Identifier: MIT

#pragma once
#include <stdexcept>
#include <string>

namespace qrecon {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// b_h is zero, input is not finite, or A_h is not positive-definite.
struct DegenerateSystem : Error {
  using Error::Error;
};

// A constructed operator is not unitary within tolerance.
struct UnitarityViolation : Error {
  using Error::Error;
};

// The ancilla = 1 subspace carries no (or negligible) norm.
struct FailedPostselection : Error {
  using Error::Error;
};

// Register sizes, qubit indices or options disagree with the supplied data.
struct ConfigurationMismatch : Error {
  using Error::Error;
};

} // namespace qrecon
