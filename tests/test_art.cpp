// SPDX-License-Identifier: MIT

#include "qrecon/art.hpp"
#include "qrecon/projection.hpp"
#include "qrecon/errors.hpp"
#include <iostream>
#include <cmath>

using namespace qrecon;

static int tests_failed = 0;
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define EXPECT_TRUE(x) do{ if (!(x)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #x "\n"; ++tests_failed; } }while(0)

template <typename E>
static bool throws(auto&& f){ try { f(); } catch (const E&) { return true; } return false; }

int main(){
  auto sys = project(reference_phantom());
  EXPECT_TRUE(sys.rows()==4 && sys.cols()==4);
  // column sums then row sums
  EXPECT_NEAR(sys.b(0), 4.0, 1e-15);
  EXPECT_NEAR(sys.b(1), 6.0, 1e-15);
  EXPECT_NEAR(sys.b(2), 3.0, 1e-15);
  EXPECT_NEAR(sys.b(3), 7.0, 1e-15);

  // Ten sweeps recover the phantom
  ArtOptions o; o.record_residuals = true;
  auto r = art_solve(sys, o);
  for (int i=0;i<4;++i) EXPECT_NEAR(r.x(i), double(i+1), 1e-6);
  EXPECT_TRUE(r.residuals.size()==10);
  EXPECT_NEAR(r.residuals.back(), 0.0, 1e-9);
  EXPECT_NEAR(residual_norm(sys, r.x), 0.0, 1e-9);

  // Under-relaxed sweeps still converge on a consistent system
  ArtOptions slow; slow.relaxation = 0.5; slow.iterations = 60; slow.record_residuals = true;
  auto rs = art_solve(sys, slow);
  EXPECT_TRUE(rs.residuals.back() < rs.residuals.front());
  EXPECT_NEAR(rs.residuals.back(), 0.0, 1e-6);

  // Further sweeps leave a converged solution alone
  ArtOptions more = o; more.iterations = 25;
  EXPECT_NEAR((art_solve(sys, more).x - r.x).norm(), 0.0, 1e-12);

  // Well-conditioned square system
  LinearSystem sq;
  sq.A = RealMatrix(2, 2); sq.A << 4, 1, 2, 3;
  RealVector truth(2); truth << 1, -2;
  sq.b = sq.A * truth;
  ArtOptions many; many.iterations = 200;
  auto rq = art_solve(sq, many);
  EXPECT_NEAR(residual_norm(sq, rq.x), 0.0, 1e-9);
  EXPECT_NEAR((rq.x - truth).norm(), 0.0, 1e-9);

  // Deterministic
  auto r2 = art_solve(sys, o);
  EXPECT_NEAR((r.x - r2.x).norm(), 0.0, 0.0);

  // Zero rows are skipped
  LinearSystem z = sys;
  z.A.conservativeResize(5, 4); z.A.row(4).setZero();
  z.b.conservativeResize(5); z.b(4) = 0.0;
  auto rz = art_solve(z, o);
  EXPECT_NEAR((rz.x - r.x).norm(), 0.0, 1e-12);

  // Normalized rows give the same reconstruction
  ProjectionOptions po; po.normalize_rows = true;
  auto rn = art_solve(project(reference_phantom(), po), o);
  for (int i=0;i<4;++i) EXPECT_NEAR(rn.x(i), double(i+1), 1e-6);

  // Invalid parameters
  ArtOptions bad = o; bad.iterations = 0;
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ art_solve(sys, bad); }));
  bad = o; bad.relaxation = 2.5;
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ art_solve(sys, bad); }));
  bad = o; bad.relaxation = 0.0;
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ art_solve(sys, bad); }));
  LinearSystem mis = sys; mis.b.conservativeResize(3);
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ art_solve(mis, o); }));
  LinearSystem nan = sys; nan.b(0) = std::nan("");
  EXPECT_TRUE(throws<DegenerateSystem>([&]{ art_solve(nan, o); }));

  // Unsupported projection angle
  ProjectionOptions diag; diag.angles_deg = {45.0};
  EXPECT_TRUE(throws<ConfigurationMismatch>([&]{ projection_matrix(2, diag); }));
  // flatten / unflatten
  EXPECT_NEAR((unflatten(flatten(reference_phantom()), 2) - reference_phantom()).norm(), 0.0, 0.0);

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
