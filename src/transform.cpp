#include "ternpack/transform.hpp"
#include "ternpack/types.hpp"

namespace ternpack {

namespace {

// Visit every (destination, source) pair where both lie inside (n, k).
template <typename F> void for_each_tile_pair(size_t n, size_t k, F &&func) {
  size_t blocks_n = div_ceil(n, TILE_ROWS);
  size_t blocks_k = div_ceil(k, TILE_COLS);

  for (size_t bn = 0; bn < blocks_n; ++bn) {
    for (size_t bk = 0; bk < blocks_k; ++bk) {
      for (size_t i = 0; i < TILE_ROWS; ++i) {
        for (size_t j = 0; j < TILE_COLS; ++j) {
          auto src = tile_source_index(i, j);
          size_t src_row = bn * TILE_ROWS + src.first;
          size_t src_col = bk * TILE_COLS + src.second;
          size_t dst_row = bn * TILE_ROWS + i;
          size_t dst_col = bk * TILE_COLS + j;

          if (src_row >= n || src_col >= k || dst_row >= n || dst_col >= k)
            continue;

          func(dst_row * k + dst_col, src_row * k + src_col);
        }
      }
    }
  }
}

} // namespace

std::vector<int8_t> permute_tiles(const int8_t *src, size_t n, size_t k) {
  std::vector<int8_t> dst(n * k, 0);
  for_each_tile_pair(n, k, [&](size_t d, size_t s) { dst[d] = src[s]; });
  return dst;
}

std::vector<int8_t> unpermute_tiles(const int8_t *permuted, size_t n,
                                    size_t k) {
  std::vector<int8_t> out(n * k, 0);
  for_each_tile_pair(n, k,
                     [&](size_t d, size_t s) { out[s] = permuted[d]; });
  return out;
}

} // namespace ternpack
