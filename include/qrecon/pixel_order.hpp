// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace qrecon {

// Mapping from simulation (system-register basis) order to the caller's
// row-major pixel order: pixel i takes simulation entry order[i].
using PixelOrder = std::vector<std::size_t>;

// Default for the 2x2 reference layout.
PixelOrder default_pixel_order();

// True when `order` is a bijection on {0..n-1}.
bool is_permutation(const PixelOrder& order, std::size_t n);
PixelOrder invert(const PixelOrder& order);

// out[i] = in[order[i]]
template <typename Vec>
Vec to_pixel_order(const Vec& in, const PixelOrder& order) {
  Vec out(in.size());
  for (std::size_t i = 0; i < order.size(); ++i) out[i] = in[order[i]];
  return out;
}

// in[order[i]] = out[i]
template <typename Vec>
Vec to_simulation_order(const Vec& pixels, const PixelOrder& order) {
  Vec out(pixels.size());
  for (std::size_t i = 0; i < order.size(); ++i) out[order[i]] = pixels[i];
  return out;
}

// "3,1,2,0"
std::optional<PixelOrder> parse_index_list(const std::string& text, std::string& err);
std::string format_index_list(const PixelOrder& order);

} // namespace qrecon
