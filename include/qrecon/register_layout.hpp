// SPDX-License-Identifier: MIT

#pragma once
#include <cstddef>
#include <vector>

namespace qrecon {

// Qubit 0 is the ancilla, qubits 1..K the clock register (clock qubit k has
// weight 2^k), then log2(n) system qubits. Classical bit 0 records the
// ancilla, bits 1..log2(n) the system qubits.
struct RegisterLayout {
  std::size_t ancilla = 0;
  std::vector<std::size_t> clock;
  std::vector<std::size_t> system;
  std::size_t ancilla_cbit = 0;
  std::vector<std::size_t> system_cbits;

  std::size_t num_qubits() const { return 1 + clock.size() + system.size(); }
  std::size_t num_clbits() const { return 1 + system_cbits.size(); }
  std::size_t dimension() const { return std::size_t(1) << num_qubits(); }
  std::size_t system_dimension() const { return std::size_t(1) << system.size(); }
};

// Throws ConfigurationMismatch unless system_size is a power of two >= 2 and
// the total register fits a dense statevector.
RegisterLayout make_layout(std::size_t clock_qubits, std::size_t system_size);

} // namespace qrecon
