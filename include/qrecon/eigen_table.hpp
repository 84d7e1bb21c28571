// SPDX-License-Identifier: MIT

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qrecon {

// Clock-register pattern -> assumed eigenvalue. Patterns are written most
// significant clock qubit first, so "10011" is the clock integer 19.
struct EigenEntry {
  std::string pattern;
  double lambda = 1.0;
};

struct EigenTable {
  std::vector<EigenEntry> entries;

  bool empty() const { return entries.empty(); }
  std::size_t size() const { return entries.size(); }
};

// Three calibrated entries for the 2x2 reference scenario (A_h spectrum {1,3,3,5}, K = 5).
EigenTable default_eigen_table();

// Clock integer of a pattern ("10011" -> 19).
std::size_t pattern_value(const std::string& pattern);
std::string pattern_string(std::size_t value, std::size_t clock_qubits);

// Ancilla rotation angle 2 asin(1/lambda).
double inversion_angle(double lambda);

// "00000:5,10011:3,00110:1". An empty string is the empty table.
std::optional<EigenTable> parse_eigen_table(const std::string& text, std::string& err);
std::string format_eigen_table(const EigenTable& t);

// Throws ConfigurationMismatch on malformed patterns, wrong length,
// duplicates or lambda < 1.
void validate(const EigenTable& t, std::size_t clock_qubits);

// One entry per clock pattern y: lambda(y) = lambda_max * y / 2^K, with
// y = 0 standing for lambda_max. Entries whose lambda falls below 1 are
// clamped to 1 (full rotation).
EigenTable phase_grid_table(std::size_t clock_qubits, double lambda_max);

} // namespace qrecon
