// SPDX-License-Identifier: MIT

#include "qrecon/eigen_table.hpp"
#include "qrecon/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace qrecon {

EigenTable default_eigen_table() {
  return EigenTable{{{"00000", 5.0}, {"10011", 3.0}, {"00110", 1.0}}};
}

std::size_t pattern_value(const std::string& pattern) {
  std::size_t v = 0;
  for (char ch : pattern) v = (v << 1) | std::size_t(ch == '1');
  return v;
}

std::string pattern_string(std::size_t value, std::size_t clock_qubits) {
  std::string s(clock_qubits, '0');
  for (std::size_t q = 0; q < clock_qubits; ++q)
    if ((value >> q) & 1) s[clock_qubits - 1 - q] = '1';
  return s;
}

double inversion_angle(double lambda) {
  return 2.0 * std::asin(1.0 / lambda);
}

static std::string trim(const std::string& s){
  auto l = std::find_if(s.begin(), s.end(), [](unsigned char c){return !std::isspace(c);} );
  auto r = std::find_if(s.rbegin(), s.rend(), [](unsigned char c){return !std::isspace(c);} ).base();
  if (l>=r) return "";
  return std::string(l,r);
}

std::optional<EigenTable> parse_eigen_table(const std::string& text, std::string& err) {
  EigenTable t;
  std::istringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (item.empty()) continue;
    auto colon = item.find(':');
    if (colon == std::string::npos) { err = "Table entry '" + item + "' is not pattern:lambda"; return std::nullopt; }
    EigenEntry e;
    e.pattern = trim(item.substr(0, colon));
    std::string lam = trim(item.substr(colon + 1));
    try {
      std::size_t pos = 0;
      e.lambda = std::stod(lam, &pos);
      if (pos != lam.size()) { err = "Invalid eigenvalue '" + lam + "'"; return std::nullopt; }
    } catch (const std::exception&) {
      err = "Invalid eigenvalue '" + lam + "'";
      return std::nullopt;
    }
    t.entries.push_back(e);
  }
  return t;
}

std::string format_eigen_table(const EigenTable& t) {
  std::ostringstream os;
  os.precision(17);
  for (std::size_t i = 0; i < t.entries.size(); ++i) {
    if (i) os << ",";
    os << t.entries[i].pattern << ":" << t.entries[i].lambda;
  }
  return os.str();
}

void validate(const EigenTable& t, std::size_t clock_qubits) {
  std::set<std::string> seen;
  for (const auto& e : t.entries) {
    if (e.pattern.size() != clock_qubits)
      throw ConfigurationMismatch("pattern '" + e.pattern + "' does not have " + std::to_string(clock_qubits) + " bits");
    if (e.pattern.find_first_not_of("01") != std::string::npos)
      throw ConfigurationMismatch("pattern '" + e.pattern + "' is not binary");
    if (!seen.insert(e.pattern).second)
      throw ConfigurationMismatch("pattern '" + e.pattern + "' appears twice");
    if (!(e.lambda >= 1.0) || !std::isfinite(e.lambda))
      throw ConfigurationMismatch("eigenvalue for '" + e.pattern + "' must be >= 1 for asin(1/lambda)");
  }
}

EigenTable phase_grid_table(std::size_t clock_qubits, double lambda_max) {
  EigenTable t;
  const std::size_t N = std::size_t(1) << clock_qubits;
  for (std::size_t y = 0; y < N; ++y) {
    double lam = (y == 0) ? lambda_max : lambda_max * double(y) / double(N);
    t.entries.push_back({pattern_string(y, clock_qubits), std::max(1.0, lam)});
  }
  return t;
}

} // namespace qrecon
