#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace ternpack {

/**
 * Source position inside a 16x32 tile for destination (i, j).
 *
 * Mirrors the per-thread fragment layout of a warp-level MMA:
 *   thread_id = i*2 + j/16
 *   row       = (thread_id/16)*8 + thread_id%8
 *   col       = j%16 + 16*((thread_id%16)/8)
 */
inline std::pair<size_t, size_t> tile_source_index(size_t i, size_t j) {
  size_t thread_id = i * 2 + j / 16;
  size_t row = (thread_id / 16) * 8 + thread_id % 8;
  size_t col = (j % 16) + 16 * ((thread_id % 16) / 8);
  return {row, col};
}

/**
 * Reorder an n x k ternary buffer into 16x32 MMA tile layout.
 * Positions whose source or destination lies outside (n, k) stay 0.
 */
std::vector<int8_t> permute_tiles(const int8_t *src, size_t n, size_t k);

/**
 * Inverse of permute_tiles. Exact when n % 16 == 0 and k % 32 == 0.
 */
std::vector<int8_t> unpermute_tiles(const int8_t *permuted, size_t n,
                                    size_t k);

} // namespace ternpack
