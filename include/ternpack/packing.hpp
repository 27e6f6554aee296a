#pragma once

/**
 * TernPack: 2-bit Packing
 *
 * 16 ternary codes per 32-bit word.
 *
 * Layout:
 *   code c -> field (c + 2) in {1, 2, 3}
 *   4 fields per byte, first code in bits 0-1
 *   4 bytes per word, little-endian
 *
 * So code j of a 16-code group lands in bits [2j, 2j+1] of its word. An
 * incomplete final group is padded with zero fields, which unpack to -2 and
 * are dropped by truncation.
 */

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ternpack {

inline size_t packed_words(size_t num_codes) {
  return div_ceil(num_codes, CODES_PER_WORD);
}

/**
 * Pack n ternary codes into ceil(n/16) words.
 */
std::vector<uint32_t> pack_ternary(const int8_t *codes, size_t n);

/**
 * Unpack words and truncate to n codes.
 *
 * Precondition: words.size() >= packed_words(n). Every caller in the library
 * sizes its buffers with packed_words(), so a shorter input is a programming
 * error rather than bad data and is reported by throwing
 * std::invalid_argument. File contents are validated before they reach here
 * (see get_bitlinear).
 */
std::vector<int8_t> unpack_ternary(const std::vector<uint32_t> &words,
                                   size_t n);

/**
 * Pack each row of a quantized matrix, rows padded independently.
 */
PackedMatrix pack_matrix(const QuantizedMatrix &q);

/**
 * Unpack a packed matrix to rows * cols codes.
 */
std::vector<int8_t> unpack_matrix(const PackedMatrix &packed);

} // namespace ternpack
