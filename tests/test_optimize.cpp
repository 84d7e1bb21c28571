// SPDX-License-Identifier: MIT

#include "qrecon/optimize.hpp"
#include "qrecon/hhl.hpp"
#include "qrecon/projection.hpp"
#include "qrecon/dot.hpp"
#include <algorithm>
#include <iostream>
#include <fstream>
#include <cstdio>
#include <cmath>

using namespace qrecon;

static int tests_failed = 0;
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define EXPECT_TRUE(x) do{ if (!(x)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #x "\n"; ++tests_failed; } }while(0)

static double max_diff(const std::vector<double>& a, const std::vector<double>& b){
  double m = 0.0;
  for (std::size_t i=0;i<a.size();++i) m = std::max(m, std::fabs(a[i]-b[i]));
  return m;
}

int main(){
  // Small hand-written circuit
  Circuit c; c.nqubits=3;
  c.ops.push_back({OpType::H,{0}});
  c.ops.push_back({OpType::X,{2}});      // commutes past the H pair
  c.ops.push_back({OpType::H,{0}});
  c.ops.push_back({OpType::RY,{1},{},0.3});
  c.ops.push_back({OpType::RY,{1},{},0.4});
  c.ops.push_back({OpType::PHASE,{1},{0},0.0});
  c.ops.push_back({OpType::SWAP,{0,2}});
  c.ops.push_back({OpType::SWAP,{2,0}});
  auto o = optimize(c);
  EXPECT_TRUE(o.ops.size()==2);
  EXPECT_TRUE(o.ops[0].type==OpType::X);
  EXPECT_NEAR(o.ops[1].angle, 0.7, 1e-15);
  EXPECT_NEAR(max_diff(run(c, 1).probabilities, run(o, 1).probabilities), 0.0, 1e-12);

  // Different controls block cancellation
  Circuit d; d.nqubits=2;
  d.ops.push_back({OpType::X,{1},{0}});
  d.ops.push_back({OpType::X,{1}});
  EXPECT_TRUE(optimize(d).ops.size()==2);

  // HHL program: back-to-back X flips between table entries cancel
  auto h = build_hermitian_system(project(reference_phantom()));
  HhlSession s(h, {});
  s.prepare_state(); s.estimate_phase(); s.invert_eigenvalues(); s.uncompute_phase();
  const Circuit& prog = s.program();
  auto po = optimize(prog);
  auto before = circuit_stats(prog), after = circuit_stats(po);
  EXPECT_TRUE(after.total < before.total);
  EXPECT_TRUE(before.max_controls==5);
  EXPECT_TRUE(before.by_type[static_cast<std::size_t>(OpType::UNITARY)]==10);
  EXPECT_NEAR(max_diff(run(prog, 9).probabilities, run(po, 9).probabilities), 0.0, 1e-10);
  // the recorded program reproduces the session state
  auto replay = run(prog, 9).probabilities;
  EXPECT_NEAR(max_diff(replay, s.state().probabilities()), 0.0, 1e-12);

  // Snapshot round trip
  const std::string path = "qrecon_test_snapshot.bin";
  EXPECT_TRUE(s.state().save(path));
  auto loaded = StateVector::load(path, s.layout().num_qubits());
  EXPECT_TRUE(loaded.has_value());
  if (loaded) {
    double m = 0.0;
    for (std::size_t i=0;i<loaded->dimension();++i) m = std::max(m, std::abs(loaded->amplitudes()[i] - s.state().amplitudes()[i]));
    EXPECT_NEAR(m, 0.0, 1e-12);
  }
  EXPECT_TRUE(!StateVector::load(path, 3).has_value());
  EXPECT_TRUE(!StateVector::load("does_not_exist.bin", 0).has_value());
  std::remove(path.c_str());

  // DOT export
  const std::string dot = "qrecon_test_circuit.dot";
  EXPECT_TRUE(export_dot(o, dot));
  std::ifstream in(dot);
  std::string first; std::getline(in, first);
  EXPECT_TRUE(first.find("digraph") != std::string::npos);
  in.close();
  std::remove(dot.c_str());

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
