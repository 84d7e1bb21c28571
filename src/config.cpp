// SPDX-License-Identifier: MIT

#include "qrecon/config.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace qrecon {

static std::string trim(const std::string& s){
  auto l = std::find_if(s.begin(), s.end(), [](unsigned char c){return !std::isspace(c);} );
  auto r = std::find_if(s.rbegin(), s.rend(), [](unsigned char c){return !std::isspace(c);} ).base();
  if (l>=r) return "";
  return std::string(l,r);
}

static bool parse_size_t(const std::string& s, std::size_t& out) {
  if (s.empty() || s[0] == '-') return false;
  try {
    std::size_t pos=0;
    unsigned long long v = std::stoull(s, &pos, 10);
    if (pos != s.size()) return false;
    out = static_cast<std::size_t>(v);
    return true;
  } catch (const std::exception&) { return false; }
}

static bool parse_double(const std::string& s, double& out) {
  try {
    std::size_t pos=0;
    out = std::stod(s, &pos);
    return pos == s.size();
  } catch (const std::exception&) { return false; }
}

static bool parse_bool(const std::string& s, bool& out) {
  if (s == "1" || s == "true" || s == "on") { out = true; return true; }
  if (s == "0" || s == "false" || s == "off") { out = false; return true; }
  return false;
}

bool load_config_kv(const std::string& path, std::map<std::string,std::string>& kv){
  std::ifstream in(path);
  if(!in) return false;
  std::string line;
  while(std::getline(in,line)){
    line = trim(line);
    if(line.empty()||line[0]=='#') continue;
    auto p=line.find('=');
    if(p==std::string::npos) continue;
    kv[trim(line.substr(0,p))]=trim(line.substr(p+1));
  }
  return true;
}

bool set_option(ReconConfig& cfg, const std::string& key, const std::string& value, std::string& err) {
  auto bad = [&](){ err = "Invalid value '" + value + "' for " + key; return false; };
  if (key == "art.iterations") {
    if (!parse_size_t(value, cfg.art.iterations) || cfg.art.iterations == 0) return bad();
  } else if (key == "art.relaxation") {
    if (!parse_double(value, cfg.art.relaxation)) return bad();
  } else if (key == "hhl.clock_qubits") {
    if (!parse_size_t(value, cfg.hhl.clock_qubits) || cfg.hhl.clock_qubits == 0) return bad();
  } else if (key == "hhl.table") {
    auto t = parse_eigen_table(value, err);
    if (!t) return false;
    cfg.hhl.table = *t;
  } else if (key == "hhl.reference_index") {
    if (!parse_size_t(value, cfg.hhl.reference_index)) return bad();
  } else if (key == "hhl.pixel_order") {
    auto o = parse_index_list(value, err);
    if (!o) return false;
    cfg.hhl.pixel_order = *o;
  } else if (key == "hhl.uncovered") {
    if (value == "zero") cfg.hhl.uncovered = UncoveredPolicy::Zero;
    else if (value == "error") cfg.hhl.uncovered = UncoveredPolicy::Error;
    else return bad();
  } else if (key == "hhl.coverage_tolerance") {
    if (!parse_double(value, cfg.hhl.coverage_tolerance) || cfg.hhl.coverage_tolerance < 0.0) return bad();
  } else if (key == "hhl.inversion") {
    if (value == "table") cfg.hhl.inversion = InversionMode::Table;
    else if (value == "grid") cfg.hhl.inversion = InversionMode::Grid;
    else return bad();
  } else if (key == "hhl.measure_system") {
    if (!parse_bool(value, cfg.hhl.measure_system)) return bad();
  } else if (key == "hhl.shots") {
    if (!parse_size_t(value, cfg.hhl.shots)) return bad();
  } else if (key == "hhl.seed") {
    std::size_t s;
    if (!parse_size_t(value, s)) return bad();
    cfg.hhl.seed = s;
  } else if (key == "source.phantom") {
    std::vector<double> vals;
    std::istringstream ss(value);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
      double v;
      if (!parse_double(trim(tok), v)) return bad();
      vals.push_back(v);
    }
    const std::size_t side = std::size_t(std::llround(std::sqrt(double(vals.size()))));
    if (vals.empty() || side * side != vals.size()) { err = "source.phantom needs a square number of values"; return false; }
    cfg.phantom.resize(Eigen::Index(side), Eigen::Index(side));
    for (std::size_t i = 0; i < vals.size(); ++i) cfg.phantom(Eigen::Index(i / side), Eigen::Index(i % side)) = vals[i];
  } else if (key == "source.normalize_rows") {
    if (!parse_bool(value, cfg.projection.normalize_rows)) return bad();
  } else {
    err = "Unknown config key '" + key + "'";
    return false;
  }
  return true;
}

bool apply_config(const std::map<std::string,std::string>& kv, ReconConfig& cfg, std::string& err) {
  for (const auto& [k, v] : kv)
    if (!set_option(cfg, k, v, err)) return false;
  return true;
}

bool load_config_file(const std::string& path, ReconConfig& cfg, std::string& err) {
  std::map<std::string,std::string> kv;
  if (!load_config_kv(path, kv)) { err = "Cannot open config file: " + path; return false; }
  return apply_config(kv, cfg, err);
}

std::string format_config(const ReconConfig& cfg) {
  std::ostringstream os;
  os.precision(17);
  os << "art.iterations=" << cfg.art.iterations << "\n";
  os << "art.relaxation=" << cfg.art.relaxation << "\n";
  os << "hhl.clock_qubits=" << cfg.hhl.clock_qubits << "\n";
  os << "hhl.table=" << format_eigen_table(cfg.hhl.table) << "\n";
  os << "hhl.reference_index=" << cfg.hhl.reference_index << "\n";
  os << "hhl.pixel_order=" << format_index_list(cfg.hhl.pixel_order) << "\n";
  os << "hhl.uncovered=" << (cfg.hhl.uncovered == UncoveredPolicy::Zero ? "zero" : "error") << "\n";
  os << "hhl.coverage_tolerance=" << cfg.hhl.coverage_tolerance << "\n";
  os << "hhl.inversion=" << (cfg.hhl.inversion == InversionMode::Table ? "table" : "grid") << "\n";
  os << "hhl.measure_system=" << (cfg.hhl.measure_system ? 1 : 0) << "\n";
  os << "hhl.shots=" << cfg.hhl.shots << "\n";
  os << "hhl.seed=" << cfg.hhl.seed << "\n";
  os << "source.phantom=";
  const auto flat = flatten(cfg.phantom);
  for (Eigen::Index i = 0; i < flat.size(); ++i) { if (i) os << ","; os << flat(i); }
  os << "\n";
  os << "source.normalize_rows=" << (cfg.projection.normalize_rows ? 1 : 0) << "\n";
  return os.str();
}

} // namespace qrecon
