// SPDX-License-Identifier: MIT

#include "qrecon/hhl.hpp"
#include "qrecon/projection.hpp"
#include "qrecon/reconstruct.hpp"
#include "qrecon/errors.hpp"
#include <iostream>
#include <sstream>
#include <cmath>

using namespace qrecon;

static int tests_failed = 0;
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define EXPECT_TRUE(x) do{ if (!(x)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #x "\n"; ++tests_failed; } }while(0)

template <typename E>
static bool throws(auto&& f){ try { f(); } catch (const E&) { return true; } return false; }

int main(){
  const auto sys = project(reference_phantom());
  const auto h = build_hermitian_system(sys);
  const RealVector exact = h.a_h.ldlt().solve(h.b_h).normalized();

  // Reference scenario with the calibrated table
  HhlSession s(h, {});
  std::ostringstream log; s.set_log(&log);
  EXPECT_TRUE(s.layout().num_qubits()==8);
  auto r = s.run();
  EXPECT_TRUE(s.stage()==Stage::Done);
  EXPECT_TRUE(r.reference_used==0);
  EXPECT_NEAR(r.amplitudes.norm(), 1.0, 1e-12);
  EXPECT_NEAR(r.amplitudes.imag().norm(), 0.0, 1e-6);
  EXPECT_TRUE(r.amplitudes(0).real() > 0.0);
  const RealVector sim = r.amplitudes.real();
  EXPECT_TRUE(cosine_similarity(sim, exact) > 0.99);
  const double expect_sim[4] = {0.26697, 0.40585, 0.54472, 0.68359};
  for (int i=0;i<4;++i) EXPECT_NEAR(sim(i), expect_sim[i], 1e-3);
  // default pixel order [3,1,2,0]
  EXPECT_NEAR(r.solution(0), sim(3), 0.0);
  EXPECT_NEAR(r.solution(1), sim(1), 0.0);
  EXPECT_NEAR(r.solution(2), sim(2), 0.0);
  EXPECT_NEAR(r.solution(3), sim(0), 0.0);
  EXPECT_TRUE(r.success_probability > 0.0 && r.success_probability <= 1.0);
  EXPECT_TRUE(r.classical_bits.size()==3);
  EXPECT_TRUE(r.counts.empty());
  EXPECT_TRUE(r.gate_count == s.program().ops.size());
  // clock distribution concentrates on y = 0 (lambda = 5) and y = 19 (lambda ~ 3)
  EXPECT_TRUE(r.clock_distribution.size()==32);
  EXPECT_NEAR(r.clock_distribution[0], 0.9524, 1e-3);
  EXPECT_NEAR(r.clock_distribution[19], 0.0417, 1e-3);
  EXPECT_TRUE(log.str().find("EIGENVALUE_INVERT") != std::string::npos);

  // b along the lambda_max eigenvector: phase 2 pi exactly, all clock weight on 00000
  HermitianSystem top = h;
  top.b_norm = h.eigenvectors.col(3);
  auto t = HhlSession(top, {}).run();
  EXPECT_NEAR(t.clock_distribution[0], 1.0, 1e-10);
  EXPECT_NEAR(t.success_probability, 1.0/25.0, 1e-10);

  // Same seed, same everything
  HhlOptions shots; shots.shots = 500;
  auto a = hhl_solve(sys, shots), b = hhl_solve(sys, shots);
  EXPECT_TRUE(a.counts == b.counts);
  std::size_t total = 0;
  for (auto& [k, v] : a.counts) { total += v; EXPECT_TRUE(k.size()==3); }
  EXPECT_TRUE(total==500);
  EXPECT_NEAR((a.solution - r.solution).norm(), 0.0, 1e-12);

  // Stages must run in order
  HhlSession early(h, {});
  EXPECT_TRUE(throws<std::logic_error>([&]{ early.estimate_phase(); }));
  early.prepare_state();
  EXPECT_TRUE(throws<std::logic_error>([&]{ early.prepare_state(); }));
  EXPECT_TRUE(throws<std::logic_error>([&]{ early.extract(); }));

  // Empty table: ancilla never rotates
  HhlOptions empty; empty.table = {};
  EXPECT_TRUE(throws<FailedPostselection>([&]{ HhlSession(h, empty).run(); }));

  // Strict coverage
  HhlOptions strict; strict.uncovered = UncoveredPolicy::Error; strict.coverage_tolerance = 1e-4;
  EXPECT_TRUE(throws<FailedPostselection>([&]{ HhlSession(h, strict).run(); }));
  strict.coverage_tolerance = 0.05;
  EXPECT_TRUE(!throws<FailedPostselection>([&]{ HhlSession(h, strict).run(); }));

  // Grid inversion needs no table
  HhlOptions grid; grid.inversion = InversionMode::Grid; grid.table = {};
  HhlSession gs(h, grid);
  auto g = gs.run();
  EXPECT_TRUE(gs.table().size()==32);
  EXPECT_TRUE(cosine_similarity(RealVector(g.amplitudes.real()), exact) > 0.999);

  // Mismatched configuration is rejected before simulation
  HhlOptions bad;
  bad.pixel_order = {0, 1, 2};
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ HhlSession session(h, bad); }));
  bad = {}; bad.pixel_order = {0, 1, 1, 2};
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ HhlSession session(h, bad); }));
  bad = {}; bad.reference_index = 4;
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ HhlSession session(h, bad); }));
  bad = {}; bad.table.entries = {{"0000", 5.0}};
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ HhlSession session(h, bad); }));
  bad = {}; bad.clock_qubits = 0;
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ HhlSession session(h, bad); }));
  LinearSystem odd; odd.A = RealMatrix::Identity(3, 3); odd.b = RealVector::Ones(3);
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ hhl_solve(odd); }));

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
