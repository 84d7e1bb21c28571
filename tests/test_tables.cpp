// SPDX-License-Identifier: MIT

#include "qrecon/eigen_table.hpp"
#include "qrecon/pixel_order.hpp"
#include "qrecon/register_layout.hpp"
#include "qrecon/errors.hpp"
#include <iostream>
#include <cmath>
#include <numbers>

using namespace qrecon;

static int tests_failed = 0;
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define EXPECT_TRUE(x) do{ if (!(x)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #x "\n"; ++tests_failed; } }while(0)

template <typename E>
static bool throws(auto&& f){ try { f(); } catch (const E&) { return true; } return false; }

int main(){
  // Patterns: most significant clock qubit first
  EXPECT_TRUE(pattern_value("10011")==19);
  EXPECT_TRUE(pattern_value("00110")==6);
  EXPECT_TRUE(pattern_string(19, 5)=="10011");
  EXPECT_TRUE(pattern_string(0, 3)=="000");
  EXPECT_NEAR(inversion_angle(1.0), std::numbers::pi, 1e-15);
  EXPECT_NEAR(std::sin(inversion_angle(5.0)/2), 0.2, 1e-15);

  std::string err;
  auto t = parse_eigen_table("00000:5, 10011:3 ,00110:1", err);
  EXPECT_TRUE(t && t->size()==3);
  EXPECT_TRUE(t->entries[1].pattern=="10011");
  EXPECT_NEAR(t->entries[1].lambda, 3.0, 0.0);
  EXPECT_TRUE(format_eigen_table(*t)==format_eigen_table(default_eigen_table()));
  auto empty = parse_eigen_table("", err);
  EXPECT_TRUE(empty && empty->empty());
  EXPECT_TRUE(!parse_eigen_table("00000", err));
  EXPECT_TRUE(!parse_eigen_table("00000:five", err));
  EXPECT_TRUE(!err.empty());

  validate(default_eigen_table(), 5);
  validate(EigenTable{}, 5);
  EXPECT_TRUE(throws<ConfigurationMismatch>([]{ validate(default_eigen_table(), 4); }));
  EXPECT_TRUE(throws<ConfigurationMismatch>([]{ validate(EigenTable{{{"0a0", 2.0}}}, 3); }));
  EXPECT_TRUE(throws<ConfigurationMismatch>([]{ validate(EigenTable{{{"010", 2.0}, {"010", 3.0}}}, 3); }));
  EXPECT_TRUE(throws<ConfigurationMismatch>([]{ validate(EigenTable{{{"010", 0.5}}}, 3); }));

  auto grid = phase_grid_table(3, 5.0);
  EXPECT_TRUE(grid.size()==8);
  EXPECT_NEAR(grid.entries[0].lambda, 5.0, 0.0);
  EXPECT_NEAR(grid.entries[4].lambda, 2.5, 1e-15);
  EXPECT_NEAR(grid.entries[1].lambda, 1.0, 0.0); // 0.625 clamped
  validate(grid, 3);

  // Pixel order
  auto order = default_pixel_order();
  EXPECT_TRUE(is_permutation(order, 4));
  EXPECT_TRUE(!is_permutation({0, 1, 1, 2}, 4));
  EXPECT_TRUE(!is_permutation({0, 1, 4, 2}, 4));
  EXPECT_TRUE(!is_permutation({0, 1, 2}, 4));
  std::vector<double> sim{10, 11, 12, 13};
  auto px = to_pixel_order(sim, order);
  EXPECT_NEAR(px[0], 13, 0.0);
  EXPECT_NEAR(px[3], 10, 0.0);
  EXPECT_TRUE(to_simulation_order(px, order)==sim);
  PixelOrder rot{1, 2, 3, 0};
  EXPECT_TRUE(to_pixel_order(sim, invert(rot))==to_simulation_order(sim, rot));
  auto parsed = parse_index_list(" 3, 1,2 ,0", err);
  EXPECT_TRUE(parsed && *parsed==order);
  EXPECT_TRUE(format_index_list(order)=="3,1,2,0");
  EXPECT_TRUE(!parse_index_list("3,,1", err));
  EXPECT_TRUE(!parse_index_list("3,-1", err));

  // Register layout
  auto l = make_layout(5, 4);
  EXPECT_TRUE(l.ancilla==0 && l.clock.front()==1 && l.clock.back()==5);
  EXPECT_TRUE(l.system.size()==2 && l.system[0]==6);
  EXPECT_TRUE(l.num_qubits()==8 && l.num_clbits()==3 && l.dimension()==256);
  EXPECT_TRUE(l.system_cbits[0]==1 && l.system_cbits[1]==2);
  EXPECT_TRUE(throws<ConfigurationMismatch>([]{ make_layout(5, 3); }));
  EXPECT_TRUE(throws<ConfigurationMismatch>([]{ make_layout(0, 4); }));
  EXPECT_TRUE(throws<ConfigurationMismatch>([]{ make_layout(40, 4); }));

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
