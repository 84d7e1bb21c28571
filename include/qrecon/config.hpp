// SPDX-License-Identifier: MIT

#pragma once
#include "art.hpp"
#include "hhl.hpp"
#include "projection.hpp"
#include <map>
#include <string>

namespace qrecon {

struct ReconConfig {
  ArtOptions art;
  HhlOptions hhl;
  ProjectionOptions projection;
  RealMatrix phantom = reference_phantom();
};

// key=value lines; '#' starts a comment line. Returns false if the file cannot be read.
bool load_config_kv(const std::string& path, std::map<std::string,std::string>& kv);

// Sets one option by key (see examples/reference.cfg). Returns false and
// fills err for unknown keys and unparsable values.
bool set_option(ReconConfig& cfg, const std::string& key, const std::string& value, std::string& err);

bool apply_config(const std::map<std::string,std::string>& kv, ReconConfig& cfg, std::string& err);

bool load_config_file(const std::string& path, ReconConfig& cfg, std::string& err);

// Inverse of load_config_file for the keys above.
std::string format_config(const ReconConfig& cfg);

} // namespace qrecon
