/**
 * TernPack: MMA Tile Permutation Tests
 */

#include "ternpack/transform.hpp"
#include "ternpack/types.hpp"
#include <algorithm>
#include <iostream>
#include <random>

using namespace ternpack;

static std::vector<int8_t> random_codes(size_t n, std::mt19937 &gen) {
  std::uniform_int_distribution<int> dist(-1, 1);
  std::vector<int8_t> codes(n);
  for (auto &c : codes)
    c = static_cast<int8_t>(dist(gen));
  return codes;
}

bool test_source_index() {
  std::cout << "Testing tile source index...\n";

  struct Case {
    size_t i, j, row, col;
  };
  Case cases[] = {
      {0, 0, 0, 0},   {0, 16, 1, 0},   {3, 17, 7, 1},  {4, 0, 0, 16},
      {8, 0, 8, 0},   {12, 5, 8, 21},  {15, 31, 15, 31},
  };

  for (const auto &c : cases) {
    auto src = tile_source_index(c.i, c.j);
    if (src.first != c.row || src.second != c.col) {
      std::cerr << "FAIL: (" << c.i << ", " << c.j << ") -> (" << src.first
                << ", " << src.second << "), expected (" << c.row << ", "
                << c.col << ")\n";
      return false;
    }
  }

  // Within one tile the mapping is a bijection
  std::vector<int> hits(TILE_ROWS * TILE_COLS, 0);
  for (size_t i = 0; i < TILE_ROWS; ++i) {
    for (size_t j = 0; j < TILE_COLS; ++j) {
      auto src = tile_source_index(i, j);
      if (src.first >= TILE_ROWS || src.second >= TILE_COLS) {
        std::cerr << "FAIL: source outside the tile\n";
        return false;
      }
      hits[src.first * TILE_COLS + src.second]++;
    }
  }
  for (int h : hits) {
    if (h != 1) {
      std::cerr << "FAIL: tile mapping is not a bijection\n";
      return false;
    }
  }

  std::cout << "  ✓ Source index OK\n";
  return true;
}

bool test_permute_single_tile() {
  std::cout << "Testing permutation of one 16x32 tile...\n";

  std::mt19937 gen(11);
  std::vector<int8_t> src = random_codes(TILE_ROWS * TILE_COLS, gen);
  std::vector<int8_t> dst = permute_tiles(src.data(), TILE_ROWS, TILE_COLS);

  for (size_t i = 0; i < TILE_ROWS; ++i) {
    for (size_t j = 0; j < TILE_COLS; ++j) {
      auto s = tile_source_index(i, j);
      if (dst[i * TILE_COLS + j] != src[s.first * TILE_COLS + s.second]) {
        std::cerr << "FAIL: dst(" << i << ", " << j << ") != src(" << s.first
                  << ", " << s.second << ")\n";
        return false;
      }
    }
  }

  std::vector<int8_t> restored =
      unpermute_tiles(dst.data(), TILE_ROWS, TILE_COLS);
  if (restored != src) {
    std::cerr << "FAIL: unpermute did not restore the tile\n";
    return false;
  }

  std::cout << "  ✓ Single tile OK\n";
  return true;
}

bool test_inverse_multi_tile() {
  std::cout << "Testing inverse over 48x96 and 64x128...\n";

  std::mt19937 gen(5);
  size_t shapes[][2] = {{48, 96}, {64, 128}, {16, 64}};
  for (const auto &shape : shapes) {
    size_t n = shape[0], k = shape[1];
    std::vector<int8_t> src = random_codes(n * k, gen);
    std::vector<int8_t> dst = permute_tiles(src.data(), n, k);

    // Full tiles only move values around
    std::vector<int8_t> a = src, b = dst;
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    if (a != b) {
      std::cerr << "FAIL: " << n << "x" << k << " is not a permutation\n";
      return false;
    }

    if (unpermute_tiles(dst.data(), n, k) != src) {
      std::cerr << "FAIL: " << n << "x" << k << " inverse mismatch\n";
      return false;
    }
  }

  std::cout << "  ✓ Multi-tile inverse OK\n";
  return true;
}

bool test_partial_tile() {
  std::cout << "Testing partial tile (10x20)...\n";

  const size_t n = 10, k = 20;
  std::vector<int8_t> src(n * k, 1);
  std::vector<int8_t> dst = permute_tiles(src.data(), n, k);

  for (size_t i = 0; i < n; ++i) {
    for (size_t j = 0; j < k; ++j) {
      auto s = tile_source_index(i, j);
      int8_t expected = (s.first < n && s.second < k) ? 1 : 0;
      if (dst[i * k + j] != expected) {
        std::cerr << "FAIL: dst(" << i << ", " << j << ") = "
                  << static_cast<int>(dst[i * k + j]) << ", expected "
                  << static_cast<int>(expected) << "\n";
        return false;
      }
    }
  }

  // (6, 5) reads from (4, 21), outside the 20 columns
  if (dst[6 * k + 5] != 0) {
    std::cerr << "FAIL: out-of-range source was not zero-filled\n";
    return false;
  }

  std::cout << "  ✓ Partial tile OK\n";
  return true;
}

int main() {
  std::cout
      << "╔══════════════════════════════════════════════════════════════╗\n";
  std::cout
      << "║             TernPack Tile Permutation Tests                  ║\n";
  std::cout
      << "╚══════════════════════════════════════════════════════════════╝\n\n";

  int passed = 0;
  int failed = 0;

  bool (*tests[])() = {test_source_index, test_permute_single_tile,
                       test_inverse_multi_tile, test_partial_tile};
  for (auto test : tests) {
    if (test())
      passed++;
    else
      failed++;
  }

  std::cout
      << "\n═══════════════════════════════════════════════════════════════\n";
  std::cout << "Results: " << passed << " passed, " << failed << " failed\n";

  return failed > 0 ? 1 : 0;
}
