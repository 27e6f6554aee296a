/**
 * TernPack: 2-bit Packing Tests
 */

#include "ternpack/packing.hpp"
#include "ternpack/quantize.hpp"
#include <iostream>
#include <random>
#include <stdexcept>

using namespace ternpack;

static std::vector<int8_t> random_codes(size_t n, std::mt19937 &gen) {
  std::uniform_int_distribution<int> dist(-1, 1);
  std::vector<int8_t> codes(n);
  for (auto &c : codes)
    c = static_cast<int8_t>(dist(gen));
  return codes;
}

bool test_packed_width() {
  std::cout << "Testing packed width for L = 0..200...\n";

  for (size_t len = 0; len <= 200; ++len) {
    std::vector<int8_t> codes(len, 1);
    std::vector<uint32_t> words = pack_ternary(codes.data(), len);
    size_t expected = (len + 15) / 16;
    if (words.size() != expected || packed_words(len) != expected) {
      std::cerr << "FAIL: L=" << len << " packed to " << words.size()
                << " words, expected " << expected << "\n";
      return false;
    }
  }

  std::cout << "  ✓ Packed width OK\n";
  return true;
}

bool test_roundtrip_all_lengths() {
  std::cout << "Testing pack/unpack for L = 0..200...\n";

  std::mt19937 gen(42);
  for (size_t len = 0; len <= 200; ++len) {
    std::vector<int8_t> codes = random_codes(len, gen);
    std::vector<uint32_t> words = pack_ternary(codes.data(), len);
    std::vector<int8_t> decoded = unpack_ternary(words, len);
    if (decoded != codes) {
      std::cerr << "FAIL: round trip mismatch at L=" << len << "\n";
      return false;
    }
  }

  std::cout << "  ✓ Round trip OK\n";
  return true;
}

bool test_bit_layout() {
  std::cout << "Testing bit layout...\n";

  struct Case {
    std::vector<int8_t> codes;
    uint32_t expected;
  };
  std::vector<Case> cases = {
      {std::vector<int8_t>(16, 0), 0xAAAAAAAAu},
      {std::vector<int8_t>(16, 1), 0xFFFFFFFFu},
      {std::vector<int8_t>(16, -1), 0x55555555u},
      // First code lands in the two least significant bits
      {{1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}, 0xAAAAAAABu},
      // Byte 1 holds codes 4..7
      {{0, 0, 0, 0, -1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}, 0xAAAAA9AAu},
      // Last code in the two most significant bits
      {{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, -1}, 0x6AAAAAAAu},
      // Tail padding is zero bits
      {{0}, 0x00000002u},
      {{-1, -1, -1, -1, -1}, 0x00000155u},
  };

  for (size_t i = 0; i < cases.size(); ++i) {
    std::vector<uint32_t> words =
        pack_ternary(cases[i].codes.data(), cases[i].codes.size());
    if (words.size() != 1 || words[0] != cases[i].expected) {
      std::cerr << "FAIL: case " << i << " packed to 0x" << std::hex
                << (words.empty() ? 0u : words[0]) << ", expected 0x"
                << cases[i].expected << std::dec << "\n";
      return false;
    }
  }

  std::cout << "  ✓ Bit layout OK\n";
  return true;
}

bool test_matrix_row_padding() {
  std::cout << "Testing per-row padding...\n";

  std::mt19937 gen(3);
  QuantizedMatrix q;
  q.rows = 3;
  q.cols = 20;
  q.codes = random_codes(q.rows * q.cols, gen);
  q.scales.assign(q.rows, 1.0f);

  PackedMatrix packed = pack_matrix(q);
  if (packed.rows != 3 || packed.cols != 20 || packed.words_per_row != 2 ||
      packed.words.size() != 6) {
    std::cerr << "FAIL: wrong packed geometry\n";
    return false;
  }

  for (size_t r = 0; r < q.rows; ++r) {
    // Each row starts on a fresh word; codes 20..31 of the row are padding
    std::vector<uint32_t> row_words(packed.row(r), packed.row(r) + 2);
    if (row_words != pack_ternary(q.row(r), q.cols)) {
      std::cerr << "FAIL: row " << r << " not packed independently\n";
      return false;
    }
    if ((row_words[1] >> 8) != 0) {
      std::cerr << "FAIL: row " << r << " padding bits are not zero\n";
      return false;
    }
  }

  if (unpack_matrix(packed) != q.codes) {
    std::cerr << "FAIL: matrix round trip mismatch\n";
    return false;
  }

  std::cout << "  ✓ Row padding OK\n";
  return true;
}

bool test_quantized_32x64() {
  std::cout << "Testing quantize + pack of a 32x64 matrix...\n";

  std::mt19937 gen(1234);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

  WeightMatrix w(32, 64);
  for (auto &v : w.data)
    v = dist(gen);

  QuantizedMatrix q = quantize_matrix(w);
  std::vector<uint32_t> words = pack_ternary(q.codes.data(), q.codes.size());
  if (words.size() != 128) {
    std::cerr << "FAIL: expected 128 words, got " << words.size() << "\n";
    return false;
  }

  std::vector<int8_t> decoded = unpack_ternary(words, 2048);
  if (decoded != q.codes) {
    std::cerr << "FAIL: flattened round trip mismatch\n";
    return false;
  }

  PackedMatrix packed = pack_matrix(q);
  if (packed.words != words) {
    std::cerr << "FAIL: aligned matrix packing differs from flat packing\n";
    return false;
  }

  std::cout << "  ✓ 32x64 OK\n";
  return true;
}

bool test_unpack_short_input() {
  std::cout << "Testing unpack with too few words...\n";

  std::vector<uint32_t> words(2, 0xAAAAAAAAu);

  // Exactly enough words: no throw
  if (unpack_ternary(words, 32) != std::vector<int8_t>(32, 0)) {
    std::cerr << "FAIL: 2 words did not unpack to 32 zero codes\n";
    return false;
  }

  try {
    (void)unpack_ternary(words, 33);
  } catch (const std::invalid_argument &) {
    std::cout << "  ✓ Short input rejected\n";
    return true;
  }
  std::cerr << "FAIL: expected std::invalid_argument\n";
  return false;
}

int main() {
  std::cout
      << "╔══════════════════════════════════════════════════════════════╗\n";
  std::cout
      << "║             TernPack Packing Tests                           ║\n";
  std::cout
      << "╚══════════════════════════════════════════════════════════════╝\n\n";

  int passed = 0;
  int failed = 0;

  bool (*tests[])() = {test_packed_width,       test_roundtrip_all_lengths,
                       test_bit_layout,         test_matrix_row_padding,
                       test_quantized_32x64,    test_unpack_short_input};
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
