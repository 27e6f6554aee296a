#pragma once

/**
 * TernPack: Integer-as-Float Channel
 *
 * Packed words are stored in F32 tensors. Each word's 32 bits are copied
 * verbatim into a float (no numeric conversion), and copied back on load.
 * Values on this path must never go through float arithmetic: NaN payloads,
 * signalling NaNs and subnormals are all legal words.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace ternpack {

static_assert(sizeof(float) == sizeof(uint32_t), "float must be 32-bit");

inline std::vector<float> words_to_floats(const std::vector<uint32_t> &words) {
  std::vector<float> out(words.size());
  if (!words.empty())
    std::memcpy(out.data(), words.data(), words.size() * sizeof(uint32_t));
  return out;
}

inline std::vector<uint32_t> floats_to_words(const float *data, size_t n) {
  std::vector<uint32_t> out(n);
  if (n > 0)
    std::memcpy(out.data(), data, n * sizeof(float));
  return out;
}

inline std::vector<uint32_t> floats_to_words(const std::vector<float> &data) {
  return floats_to_words(data.data(), data.size());
}

} // namespace ternpack
