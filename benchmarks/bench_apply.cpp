// SPDX-License-Identifier: MIT

#include "qrecon/hhl.hpp"
#include "qrecon/projection.hpp"
#include <chrono>
#include <iostream>

using namespace qrecon;

// Full HHL run on the reference system for growing clock registers (grid inversion).
int main(){
  auto h = build_hermitian_system(project(reference_phantom()));
  for (std::size_t k : {3, 5, 7, 9}){
    HhlOptions o; o.clock_qubits = k; o.inversion = InversionMode::Grid;
    auto t0 = std::chrono::steady_clock::now();
    HhlSession s(h, o);
    auto r = s.run();
    auto t1 = std::chrono::steady_clock::now();
    std::chrono::duration<double> dt = t1 - t0;
    std::cout << "K=" << k << " qubits=" << s.layout().num_qubits() << " gates=" << r.gate_count
              << " p_success=" << r.success_probability << " seconds=" << dt.count() << "\n";
  }
  return 0;
}
