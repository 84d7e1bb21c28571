// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <cmath>

namespace qrecon::gates {
  inline void X_coeffs(c64& u00, c64& u01, c64& u10, c64& u11) {
    u00 = {0,0}; u01 = {1,0}; u10 = {1,0}; u11 = {0,0};
  }
  inline void H_coeffs(c64& u00, c64& u01, c64& u10, c64& u11) {
    double s = 1.0/std::sqrt(2.0);
    u00 = {s,0}; u01 = {s,0}; u10 = {s,0}; u11 = {-s,0};
  }
  inline void RY_coeffs(double theta, c64& u00, c64& u01, c64& u10, c64& u11) {
    double c = std::cos(theta/2.0);
    double s = std::sin(theta/2.0);
    u00 = {c,0}; u01 = {-s,0}; u10 = {s,0}; u11 = {c,0};
  }
  // diag(1, e^{iθ}); used with one control as the controlled-phase gate.
  inline void P_coeffs(double theta, c64& u00, c64& u01, c64& u10, c64& u11) {
    u00 = {1,0}; u01 = {0,0}; u10 = {0,0};
    u11 = { std::cos(theta), std::sin(theta) };
  }

}
