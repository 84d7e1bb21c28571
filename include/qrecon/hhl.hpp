// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include "eigen_table.hpp"
#include "evolution.hpp"
#include "linear_system.hpp"
#include "pixel_order.hpp"
#include "register_layout.hpp"
#include <iosfwd>
#include <map>
#include <string>

namespace qrecon {

enum class Stage { Init, StatePrep, PhaseEstimate, EigenvalueInvert, InversePhaseEstimate, Measure, PostselectExtract, Done };
const char* stage_name(Stage s);

// What the ancilla does on clock patterns missing from the table.
enum class UncoveredPolicy { Zero, Error };
// Table: the configured calibration table. Grid: one entry per clock pattern.
enum class InversionMode { Table, Grid };

struct HhlOptions {
  std::size_t clock_qubits = 5;
  EigenTable table = default_eigen_table();
  std::size_t reference_index = 0;
  PixelOrder pixel_order = default_pixel_order();
  UncoveredPolicy uncovered = UncoveredPolicy::Zero;
  double coverage_tolerance = 0.01;
  InversionMode inversion = InversionMode::Table;
  bool measure_system = true;
  std::size_t shots = 0;
  uint64_t seed = 12345;
  double postselect_tolerance = 1e-12;
  double unitarity_tolerance = 1e-10;
};

struct HhlResult {
  RealVector solution;                 // pixel order, real part
  ComplexVector amplitudes;            // simulation order, normalized, phase fixed
  double success_probability = 0.0;    // P(ancilla = 1)
  std::size_t reference_used = 0;
  std::vector<int> classical_bits;     // bit 0 = ancilla
  std::map<std::string, std::size_t> counts; // MSB-first classical strings
  std::vector<double> clock_distribution;    // after phase estimation
  std::size_t gate_count = 0;
};

// One simulation run: owns the register layout, statevector, classical bits
// and the recorded gate program. Stages must be called in order.
class HhlSession {
  HermitianSystem h_;
  HhlOptions opts_;
  RegisterLayout layout_;
  UnitaryEvolutionBank bank_;
  EigenTable table_;
  StateVector sv_;
  Circuit program_;
  Rng rng_;
  std::vector<int> cbits_;
  std::vector<double> clock_dist_;
  std::map<std::string, std::size_t> counts_;
  Stage stage_ = Stage::Init;
  std::ostream* log_ = nullptr;

  void advance_(Stage expected, Stage next);
  void emit_(Op op);
  void log_stage_(const std::string& msg) const;

public:
  // Validates options against the system; throws ConfigurationMismatch
  // before any simulation happens.
  HhlSession(const HermitianSystem& h, HhlOptions opts);

  Stage stage() const { return stage_; }
  const RegisterLayout& layout() const { return layout_; }
  const StateVector& state() const { return sv_; }
  const Circuit& program() const { return program_; }
  const EigenTable& table() const { return table_; }
  const UnitaryEvolutionBank& bank() const { return bank_; }
  void set_log(std::ostream* os) { log_ = os; }

  void prepare_state();
  void estimate_phase();
  void invert_eigenvalues();
  void uncompute_phase();
  void measure();
  HhlResult extract();

  // All stages in order.
  HhlResult run();
};

HhlResult hhl_solve(const LinearSystem& sys, const HhlOptions& opts = {});

} // namespace qrecon
