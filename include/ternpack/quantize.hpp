#pragma once

/**
 * TernPack: Quantization Engine
 *
 * Converts FP32 weight matrices to ternary codes with one absmean scale per
 * row (BitNet b1.58 style).
 */

#include "types.hpp"
#include <algorithm>
#include <cmath>

namespace ternpack {

// ============================================================================
// Quantization Statistics
// ============================================================================

struct QuantizationStats {
  size_t neg_count = 0;
  size_t zero_count = 0;
  size_t pos_count = 0;
  size_t other_count = 0; // Anything outside {-1, 0, +1}
  float min_scale = 0.0f;
  float max_scale = 0.0f;

  void compute(const int8_t *codes, size_t n, const float *scales,
               size_t num_scales) {
    neg_count = zero_count = pos_count = other_count = 0;
    for (size_t i = 0; i < n; ++i) {
      switch (codes[i]) {
      case -1:
        neg_count++;
        break;
      case 0:
        zero_count++;
        break;
      case 1:
        pos_count++;
        break;
      default:
        other_count++;
        break;
      }
    }

    if (num_scales == 0)
      return;
    min_scale = scales[0];
    max_scale = scales[0];
    for (size_t i = 1; i < num_scales; ++i) {
      min_scale = std::min(min_scale, scales[i]);
      max_scale = std::max(max_scale, scales[i]);
    }
  }

  size_t total() const { return neg_count + zero_count + pos_count + other_count; }

  float sparsity() const {
    size_t n = total();
    return n > 0 ? static_cast<float>(zero_count) / n : 0.0f;
  }
};

// ============================================================================
// Ternary Quantization
// ============================================================================

/**
 * Absmean scale of one row: mean(|x|), accumulated in double.
 * Returns 0 for an all-zero (or empty) row, and also for a row whose mean
 * underflows float (e.g. one denorm_min among zeros). Such a row is then
 * handled exactly like an all-zero row.
 */
inline float compute_row_scale(const float *data, size_t n) {
  if (n == 0)
    return 0.0f;
  double abs_sum = 0.0;
  for (size_t i = 0; i < n; ++i) {
    abs_sum += std::abs(data[i]);
  }
  return static_cast<float>(abs_sum / n);
}

/**
 * Quantize a normalized weight to {-1, 0, +1}.
 *
 * round(clamp(x, -1, 1)) with ties to even. Within [-1, 1] the only ties are
 * +-0.5, which both go to 0. NaN maps to 0.
 */
inline int8_t quantize_ternary(float normalized) {
  if (normalized > 0.5f)
    return 1;
  if (normalized < -0.5f)
    return -1;
  return 0;
}

/**
 * Quantize every row of a matrix independently.
 *
 * A zero scale (all-zero row, or a subnormal row whose mean underflows) is
 * kept as 0.0f and its row quantizes to all zeros.
 */
QuantizedMatrix quantize_matrix(const WeightMatrix &weights);

/**
 * code * scale for every element (verification only).
 */
std::vector<float> dequantize_matrix(const QuantizedMatrix &q);

} // namespace ternpack
