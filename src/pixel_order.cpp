// SPDX-License-Identifier: MIT

#include "qrecon/pixel_order.hpp"
#include <sstream>

namespace qrecon {

PixelOrder default_pixel_order() {
  return {3, 1, 2, 0};
}

bool is_permutation(const PixelOrder& order, std::size_t n) {
  if (order.size() != n) return false;
  std::vector<bool> seen(n, false);
  for (auto v : order) {
    if (v >= n || seen[v]) return false;
    seen[v] = true;
  }
  return true;
}

PixelOrder invert(const PixelOrder& order) {
  PixelOrder inv(order.size());
  for (std::size_t i = 0; i < order.size(); ++i) inv[order[i]] = i;
  return inv;
}

std::optional<PixelOrder> parse_index_list(const std::string& text, std::string& err) {
  PixelOrder out;
  std::istringstream ss(text);
  std::string tok;
  while (std::getline(ss, tok, ',')) {
    auto l = tok.find_first_not_of(" \t");
    auto r = tok.find_last_not_of(" \t");
    if (l == std::string::npos) { err = "Empty index in '" + text + "'"; return std::nullopt; }
    tok = tok.substr(l, r - l + 1);
    try {
      std::size_t pos = 0;
      unsigned long long v = std::stoull(tok, &pos, 10);
      if (pos != tok.size() || tok[0] == '-') { err = "Invalid index '" + tok + "'"; return std::nullopt; }
      out.push_back(static_cast<std::size_t>(v));
    } catch (const std::exception&) {
      err = "Invalid index '" + tok + "'";
      return std::nullopt;
    }
  }
  if (out.empty()) { err = "Empty index list"; return std::nullopt; }
  return out;
}

std::string format_index_list(const PixelOrder& order) {
  std::ostringstream os;
  for (std::size_t i = 0; i < order.size(); ++i) { if (i) os << ","; os << order[i]; }
  return os.str();
}

} // namespace qrecon
