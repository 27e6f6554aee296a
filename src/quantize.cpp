/**
 * TernPack: Quantization Implementation
 */

#include "ternpack/quantize.hpp"

namespace ternpack {

QuantizedMatrix quantize_matrix(const WeightMatrix &weights) {
  QuantizedMatrix result;
  result.rows = weights.rows;
  result.cols = weights.cols;
  result.codes.assign(weights.rows * weights.cols, 0);
  result.scales.assign(weights.rows, 0.0f);

  for (size_t r = 0; r < weights.rows; ++r) {
    const float *src = weights.row(r);
    int8_t *dst = result.codes.data() + r * weights.cols;

    float scale = compute_row_scale(src, weights.cols);
    result.scales[r] = scale;

    // All-zero or underflowed row: codes stay 0, no division
    if (scale == 0.0f)
      continue;

    for (size_t c = 0; c < weights.cols; ++c) {
      dst[c] = quantize_ternary(src[c] / scale);
    }
  }

  return result;
}

std::vector<float> dequantize_matrix(const QuantizedMatrix &q) {
  std::vector<float> out(q.rows * q.cols);
  for (size_t r = 0; r < q.rows; ++r) {
    const int8_t *codes = q.row(r);
    float scale = q.scales[r];
    for (size_t c = 0; c < q.cols; ++c) {
      out[r * q.cols + c] = codes[c] * scale;
    }
  }
  return out;
}

} // namespace ternpack
