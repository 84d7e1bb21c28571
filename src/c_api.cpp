// SPDX-License-Identifier: MIT

#include "qrecon/c_api.h"
#include "qrecon/errors.hpp"
#include "qrecon/reconstruct.hpp"
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <utility>

namespace {

thread_local std::string last_error;

std::string get_kv(const std::string& js, const std::string& k){
  auto p = js.find("\"" + k + "\"");
  if (p==std::string::npos) return "";
  p = js.find(':', p);
  if (p==std::string::npos) return "";
  auto q = js.find_first_not_of(" \t\r\n", p+1);
  if (q==std::string::npos) return "";
  if (js[q]=='"'){ auto e = js.find('"', q+1); return js.substr(q+1, e-q-1); }
  auto e = js.find_first_of(",}\n", q);
  auto v = js.substr(q, e-q);
  auto r = v.find_last_not_of(" \t\r");
  return r==std::string::npos ? "" : v.substr(0, r+1);
}

const std::pair<const char*, const char*> option_keys[] = {
  {"iterations", "art.iterations"},
  {"relaxation", "art.relaxation"},
  {"clock_qubits", "hhl.clock_qubits"},
  {"table", "hhl.table"},
  {"reference_index", "hhl.reference_index"},
  {"pixel_order", "hhl.pixel_order"},
  {"uncovered", "hhl.uncovered"},
  {"inversion", "hhl.inversion"},
  {"shots", "hhl.shots"},
  {"seed", "hhl.seed"},
};

int fail(int code, const std::string& msg){
  last_error = msg;
  return code;
}

} // namespace

extern "C" {

int qrecon_run(const char* options_json, char** out_json){
  if (!out_json) return fail(2, "out_json is NULL");
  *out_json = nullptr;
  last_error.clear();
  std::string opts = options_json ? options_json : "";
  qrecon::ReconConfig cfg;
  for (const auto& [json_key, cfg_key] : option_keys){
    if (opts.find(std::string("\"") + json_key + "\"") == std::string::npos) continue;
    std::string err;
    if (!qrecon::set_option(cfg, cfg_key, get_kv(opts, json_key), err)) return fail(3, err);
  }
  std::ostringstream os;
  try {
    auto report = qrecon::run_reconstruction(cfg);
    qrecon::write_json(os, report);
  } catch (const qrecon::DegenerateSystem& e) {
    return fail(5, e.what());
  } catch (const qrecon::FailedPostselection& e) {
    return fail(6, e.what());
  } catch (const qrecon::ConfigurationMismatch& e) {
    return fail(7, e.what());
  } catch (const qrecon::UnitarityViolation& e) {
    return fail(8, e.what());
  }
  std::string js = os.str();
  char* buf = static_cast<char*>(std::malloc(js.size()+1));
  if (!buf) return fail(2, "out of memory");
  std::memcpy(buf, js.data(), js.size()); buf[js.size()]='\0';
  *out_json = buf;
  return 0;
}

const char* qrecon_last_error(void){ return last_error.c_str(); }

void qrecon_free(char* p){ if (p) std::free(p); }

const char* qrecon_version(void){
#ifdef QRECON_VERSION
  return QRECON_VERSION;
#else
  return "unknown";
#endif
}

} // extern "C"
