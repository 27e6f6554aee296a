/**
 * TernPack: 2-bit Packing Implementation
 */

#include "ternpack/packing.hpp"
#include <stdexcept>

namespace ternpack {

namespace {

void pack_row(const int8_t *codes, size_t n, uint32_t *out) {
  size_t num_bytes = div_ceil(n, CODES_PER_BYTE);
  size_t num_words = packed_words(n);

  // Codes -> bytes
  std::vector<uint8_t> bytes(num_words * 4, 0);
  for (size_t b = 0; b < num_bytes; ++b) {
    uint8_t byte = 0;
    for (size_t j = 0; j < CODES_PER_BYTE; ++j) {
      size_t idx = b * CODES_PER_BYTE + j;
      if (idx < n) {
        uint8_t field = static_cast<uint8_t>(codes[idx] + CODE_OFFSET) & 0x3;
        byte |= static_cast<uint8_t>(field << (2 * j));
      }
    }
    bytes[b] = byte;
  }

  // Bytes -> little-endian words
  for (size_t w = 0; w < num_words; ++w) {
    const uint8_t *b = bytes.data() + w * 4;
    out[w] = static_cast<uint32_t>(b[0]) |
             (static_cast<uint32_t>(b[1]) << 8) |
             (static_cast<uint32_t>(b[2]) << 16) |
             (static_cast<uint32_t>(b[3]) << 24);
  }
}

void unpack_row(const uint32_t *words, size_t n, int8_t *out) {
  for (size_t i = 0; i < n; ++i) {
    uint32_t word = words[i / CODES_PER_WORD];
    size_t shift = 2 * (i % CODES_PER_WORD);
    int field = static_cast<int>((word >> shift) & 0x3);
    out[i] = static_cast<int8_t>(field - CODE_OFFSET);
  }
}

} // namespace

std::vector<uint32_t> pack_ternary(const int8_t *codes, size_t n) {
  std::vector<uint32_t> words(packed_words(n), 0);
  if (n > 0)
    pack_row(codes, n, words.data());
  return words;
}

std::vector<int8_t> unpack_ternary(const std::vector<uint32_t> &words,
                                   size_t n) {
  if (words.size() < packed_words(n)) {
    throw std::invalid_argument("unpack_ternary: " +
                                std::to_string(words.size()) +
                                " words cannot hold " + std::to_string(n) +
                                " codes");
  }
  std::vector<int8_t> codes(n);
  unpack_row(words.data(), n, codes.data());
  return codes;
}

PackedMatrix pack_matrix(const QuantizedMatrix &q) {
  PackedMatrix packed;
  packed.rows = q.rows;
  packed.cols = q.cols;
  packed.words_per_row = packed_words(q.cols);
  packed.words.assign(q.rows * packed.words_per_row, 0);

  if (q.cols == 0)
    return packed;

  for (size_t r = 0; r < q.rows; ++r) {
    pack_row(q.row(r), q.cols,
             packed.words.data() + r * packed.words_per_row);
  }
  return packed;
}

std::vector<int8_t> unpack_matrix(const PackedMatrix &packed) {
  std::vector<int8_t> codes(packed.rows * packed.cols);
  for (size_t r = 0; r < packed.rows; ++r) {
    unpack_row(packed.row(r), packed.cols, codes.data() + r * packed.cols);
  }
  return codes;
}

} // namespace ternpack
