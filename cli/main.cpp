// SPDX-License-Identifier: MIT

#include "qrecon/reconstruct.hpp"
#include "qrecon/optimize.hpp"
#include "qrecon/dot.hpp"
#include "qrecon/errors.hpp"
#include <iostream>
#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace qrecon;

static void usage() {
  std::cout << "qrecon [--version|--build-info]\n"
               "qrecon run [--config F] [--iterations N] [--relaxation W] [--clock K] [--table T]\n"
               "           [--reference I] [--pixel-order P] [--uncovered zero|error] [--inversion table|grid]\n"
               "           [--shots S] [--seed S] [--out file.json] [--dump-state file] [--verbose]\n"
               "qrecon circuit [--config F] [--clock K] [--table T] [--inversion table|grid] [--optimize] [--dot file.dot]\n";
}

// Flags that map one-to-one onto config keys.
static const std::map<std::string, std::string> flag_keys = {
  {"--iterations", "art.iterations"},
  {"--relaxation", "art.relaxation"},
  {"--clock", "hhl.clock_qubits"},
  {"--table", "hhl.table"},
  {"--reference", "hhl.reference_index"},
  {"--pixel-order", "hhl.pixel_order"},
  {"--uncovered", "hhl.uncovered"},
  {"--inversion", "hhl.inversion"},
  {"--shots", "hhl.shots"},
  {"--seed", "hhl.seed"},
};

struct CliArgs {
  std::string config_path, out_path, dump_path, dot_path;
  bool verbose = false, optimize_circuit = false;
  std::vector<std::pair<std::string, std::string>> overrides;
};

// Returns 0 on success, an exit code otherwise.
static int parse_args(int argc, char** argv, CliArgs& a) {
  for (int i=2;i<argc;i++){
    std::string s=argv[i];
    auto nx=[&](std::string& dst){ if(i+1>=argc){ std::cerr<<"Missing value for "<<s<<"\n"; return false; } dst=argv[++i]; return true; };
    if (s=="--help"||s=="-h"){ usage(); return -1; }
    else if (s=="--config"){ if(!nx(a.config_path)) return 2; }
    else if (s=="--out"){ if(!nx(a.out_path)) return 2; }
    else if (s=="--dump-state"){ if(!nx(a.dump_path)) return 2; }
    else if (s=="--dot"){ if(!nx(a.dot_path)) return 2; }
    else if (s=="--verbose"||s=="-v") a.verbose=true;
    else if (s=="--optimize") a.optimize_circuit=true;
    else if (auto it=flag_keys.find(s); it!=flag_keys.end()){
      std::string v; if(!nx(v)) return 2;
      a.overrides.emplace_back(it->second, v);
    }
    else { std::cerr<<"Unknown arg: "<<s<<"\n"; return 2; }
  }
  return 0;
}

static int load_config(const CliArgs& a, ReconConfig& cfg) {
  std::string err;
  if (!a.config_path.empty() && !load_config_file(a.config_path, cfg, err)) { std::cerr<<err<<"\n"; return 3; }
  for (const auto& [k, v] : a.overrides)
    if (!set_option(cfg, k, v, err)) { std::cerr<<err<<"\n"; return 2; }
  return 0;
}

// Maps the error taxonomy onto exit codes.
template <typename F>
static int guarded(F&& body) {
  try {
    return body();
  } catch (const DegenerateSystem& e) {
    std::cerr << "Degenerate system: " << e.what() << "\n"; return 5;
  } catch (const FailedPostselection& e) {
    std::cerr << "Failed postselection: " << e.what() << "\n"; return 6;
  } catch (const ConfigurationMismatch& e) {
    std::cerr << "Configuration mismatch: " << e.what() << "\n"; return 7;
  } catch (const UnitarityViolation& e) {
    std::cerr << "Unitarity violation: " << e.what() << "\n"; return 8;
  }
}

static int cmd_run(const CliArgs& a, const ReconConfig& cfg) {
  return guarded([&]{
    if (a.verbose) std::cerr << "[config]\n" << format_config(cfg);
    ReconConfig run_cfg = cfg;
    run_cfg.art.record_residuals = true;
    auto report = run_reconstruction(run_cfg, a.verbose ? &std::cerr : nullptr);
    if (!a.out_path.empty()) {
      std::ofstream out(a.out_path);
      if (!out) { std::cerr<<"Cannot open out file\n"; return 4; }
      write_json(out, report);
      if (!out) { std::cerr<<"Failed writing "<<a.out_path<<"\n"; return 4; }
    } else {
      write_json(std::cout, report);
    }
    if (!a.dump_path.empty()) {
      // Replays the recorded program so the snapshot holds the pre-measurement state.
      HhlSession session(report.hermitian, cfg.hhl);
      session.prepare_state(); session.estimate_phase(); session.invert_eigenvalues(); session.uncompute_phase();
      if (!session.state().save(a.dump_path)) { std::cerr<<"Cannot write state snapshot\n"; return 4; }
      if (a.verbose) std::cerr << "[state] " << session.state().num_qubits() << " qubits written to " << a.dump_path << "\n";
    }
    return 0;
  });
}

static int cmd_circuit(const CliArgs& a, const ReconConfig& cfg) {
  return guarded([&]{
    auto sys = project(cfg.phantom, cfg.projection);
    HhlSession session(build_hermitian_system(sys), cfg.hhl);
    session.run();
    Circuit c = session.program();
    auto before = circuit_stats(c);
    if (a.optimize_circuit) c = optimize(c);
    auto after = circuit_stats(c);
    std::cout << "{\n  \"nqubits\": " << c.nqubits << ",\n  \"nclbits\": " << c.nclbits
              << ",\n  \"gates\": " << before.total;
    if (a.optimize_circuit) std::cout << ",\n  \"gates_optimized\": " << after.total;
    std::cout << ",\n  \"max_controls\": " << after.max_controls << ",\n  \"histogram\": {";
    bool first = true;
    for (std::size_t t=0;t<8;++t){
      if (!after.by_type[t]) continue;
      std::cout << (first ? "" : ", ") << "\"" << op_name(static_cast<OpType>(t)) << "\": " << after.by_type[t];
      first = false;
    }
    std::cout << "}\n}\n";
    if (!a.dot_path.empty() && !export_dot(c, a.dot_path)) { std::cerr<<"Failed to export DOT\n"; return 4; }
    return 0;
  });
}

int main(int argc, char** argv) {
  if (argc < 2) { usage(); return 1; }
  std::string cmd = argv[1];
  if (cmd == "--version") { std::cout << QRECON_VERSION << "\n"; return 0; }
  if (cmd == "--build-info") {
    std::cout << "version=" << QRECON_VERSION << "\n";
#ifdef QRECON_OPENMP
    std::cout << "openmp=1\n";
#else
    std::cout << "openmp=0\n";
#endif
    return 0;
  }
  if (cmd != "run" && cmd != "circuit") { usage(); return 1; }

  CliArgs args;
  if (int rc = parse_args(argc, argv, args); rc != 0) return rc < 0 ? 0 : rc;
  ReconConfig cfg;
  if (int rc = load_config(args, cfg); rc != 0) return rc;
  return cmd == "run" ? cmd_run(args, cfg) : cmd_circuit(args, cfg);
}
