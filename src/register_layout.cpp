// SPDX-License-Identifier: MIT

#include "qrecon/register_layout.hpp"
#include "qrecon/errors.hpp"
#include <string>

namespace qrecon {

RegisterLayout make_layout(std::size_t clock_qubits, std::size_t system_size) {
  if (clock_qubits == 0)
    throw ConfigurationMismatch("clock register needs at least one qubit");
  if (system_size < 2 || (system_size & (system_size - 1)) != 0)
    throw ConfigurationMismatch("system size " + std::to_string(system_size) + " is not a power of two");
  std::size_t sys_qubits = 0;
  while ((std::size_t(1) << sys_qubits) < system_size) ++sys_qubits;
  if (1 + clock_qubits + sys_qubits > 26)
    throw ConfigurationMismatch("register of " + std::to_string(1 + clock_qubits + sys_qubits) + " qubits is too large for dense simulation");

  RegisterLayout l;
  l.ancilla = 0;
  for (std::size_t k = 0; k < clock_qubits; ++k) l.clock.push_back(1 + k);
  for (std::size_t j = 0; j < sys_qubits; ++j) {
    l.system.push_back(1 + clock_qubits + j);
    l.system_cbits.push_back(1 + j);
  }
  l.ancilla_cbit = 0;
  return l;
}

} // namespace qrecon
