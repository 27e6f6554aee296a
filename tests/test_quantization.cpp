/**
 * TernPack: Quantization Unit Tests
 */

#include "ternpack/quantize.hpp"
#include "ternpack/types.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <random>

using namespace ternpack;

bool test_ternary_quantization() {
  std::cout << "Testing ternary quantization...\n";

  float values[] = {0.9f, -0.7f, 0.2f, -0.49f, 0.0f, 3.0f, -12.0f, 0.51f};
  int8_t expected[] = {1, -1, 0, 0, 0, 1, -1, 1};

  for (int i = 0; i < 8; ++i) {
    int8_t result = quantize_ternary(values[i]);
    if (result != expected[i]) {
      std::cerr << "FAIL: quantize_ternary(" << values[i] << ")\n";
      std::cerr << "  Expected: " << static_cast<int>(expected[i]) << "\n";
      std::cerr << "  Got:      " << static_cast<int>(result) << "\n";
      return false;
    }
  }

  if (quantize_ternary(std::nanf("")) != 0) {
    std::cerr << "FAIL: NaN should quantize to 0\n";
    return false;
  }

  std::cout << "  ✓ Ternary quantization OK\n";
  return true;
}

bool test_tie_break() {
  std::cout << "Testing tie-break at +-0.5...\n";

  // Exact ties round to even (0)
  if (quantize_ternary(0.5f) != 0 || quantize_ternary(-0.5f) != 0) {
    std::cerr << "FAIL: +-0.5 must round to 0\n";
    return false;
  }
  if (quantize_ternary(1.0f) != 1 || quantize_ternary(-1.0f) != -1) {
    std::cerr << "FAIL: +-1.0 must stay +-1\n";
    return false;
  }

  // Through a matrix: row {1, 3} has scale 2 -> normalized {0.5, 1.5}
  WeightMatrix w(2, 2);
  w.data = {1.0f, 3.0f, -1.0f, -3.0f};
  QuantizedMatrix q = quantize_matrix(w);

  int8_t expected[] = {0, 1, 0, -1};
  for (int i = 0; i < 4; ++i) {
    if (q.codes[i] != expected[i]) {
      std::cerr << "FAIL: tie row code " << i << " = "
                << static_cast<int>(q.codes[i]) << ", expected "
                << static_cast<int>(expected[i]) << "\n";
      return false;
    }
  }

  std::cout << "  ✓ Tie-break OK\n";
  return true;
}

bool test_row_scale() {
  std::cout << "Testing row scale...\n";

  WeightMatrix w(2, 4);
  w.data = {1.0f, -2.0f, 3.0f, -4.0f, 0.5f, 0.5f, -0.5f, -0.5f};
  QuantizedMatrix q = quantize_matrix(w);

  if (q.scales.size() != 2) {
    std::cerr << "FAIL: expected 2 scales, got " << q.scales.size() << "\n";
    return false;
  }
  if (std::abs(q.scales[0] - 2.5f) > 1e-6f ||
      std::abs(q.scales[1] - 0.5f) > 1e-6f) {
    std::cerr << "FAIL: scales " << q.scales[0] << ", " << q.scales[1]
              << "\n";
    return false;
  }

  // Row 0 normalized: 0.4, -0.8, 1.2, -1.6
  int8_t expected[] = {0, -1, 1, -1, 1, 1, -1, -1};
  for (int i = 0; i < 8; ++i) {
    if (q.codes[i] != expected[i]) {
      std::cerr << "FAIL: code " << i << " = " << static_cast<int>(q.codes[i])
                << "\n";
      return false;
    }
  }

  std::cout << "  ✓ Row scale OK\n";
  return true;
}

bool test_quantization_range() {
  std::cout << "Testing quantization range...\n";

  std::mt19937 gen(7);
  std::normal_distribution<float> dist(0.0f, 5.0f);

  WeightMatrix w(37, 53);
  for (auto &v : w.data)
    v = dist(gen);
  // A row with one outlier
  w.row(3)[10] = 1e6f;

  QuantizedMatrix q = quantize_matrix(w);
  if (q.rows != 37 || q.cols != 53 || q.codes.size() != 37 * 53 ||
      q.scales.size() != 37) {
    std::cerr << "FAIL: wrong output shape\n";
    return false;
  }

  for (size_t i = 0; i < q.codes.size(); ++i) {
    if (q.codes[i] < -1 || q.codes[i] > 1) {
      std::cerr << "FAIL: code " << static_cast<int>(q.codes[i])
                << " at index " << i << "\n";
      return false;
    }
  }

  std::cout << "  ✓ Quantization range OK\n";
  return true;
}

bool test_zero_row() {
  std::cout << "Testing all-zero row...\n";

  WeightMatrix w(3, 8);
  for (size_t c = 0; c < 8; ++c) {
    w.row(0)[c] = 0.25f * (c + 1);
    w.row(2)[c] = -0.1f;
  }
  // Row 1 stays all zeros

  QuantizedMatrix q = quantize_matrix(w);

  if (std::isnan(q.scales[1]) || q.scales[1] != 0.0f) {
    std::cerr << "FAIL: zero row scale is " << q.scales[1] << "\n";
    return false;
  }
  for (size_t c = 0; c < 8; ++c) {
    if (q.row(1)[c] != 0) {
      std::cerr << "FAIL: zero row code " << c << " is "
                << static_cast<int>(q.row(1)[c]) << "\n";
      return false;
    }
  }
  for (float s : q.scales) {
    if (std::isnan(s)) {
      std::cerr << "FAIL: NaN scale\n";
      return false;
    }
  }

  std::cout << "  ✓ Zero row OK\n";
  return true;
}

bool test_subnormal_row() {
  std::cout << "Testing subnormal rows...\n";

  const float tiny = std::numeric_limits<float>::denorm_min();

  // Mean of {tiny, 0, 0, 0} underflows float: handled as an all-zero row
  WeightMatrix w(2, 4);
  w.data = {tiny, 0.0f, 0.0f, 0.0f, tiny, tiny, -tiny, tiny};
  QuantizedMatrix q = quantize_matrix(w);

  if (q.scales[0] != 0.0f || std::isnan(q.scales[0])) {
    std::cerr << "FAIL: underflowed scale is " << q.scales[0] << "\n";
    return false;
  }
  for (size_t c = 0; c < 4; ++c) {
    if (q.row(0)[c] != 0) {
      std::cerr << "FAIL: underflowed row code " << c << " is "
                << static_cast<int>(q.row(0)[c]) << "\n";
      return false;
    }
  }

  // A row of denorm_min magnitudes keeps a representable scale
  if (q.scales[1] != tiny) {
    std::cerr << "FAIL: subnormal scale is " << q.scales[1] << "\n";
    return false;
  }
  int8_t expected[] = {1, 1, -1, 1};
  for (size_t c = 0; c < 4; ++c) {
    if (q.row(1)[c] != expected[c]) {
      std::cerr << "FAIL: subnormal row code " << c << " is "
                << static_cast<int>(q.row(1)[c]) << "\n";
      return false;
    }
  }

  std::cout << "  ✓ Subnormal rows OK\n";
  return true;
}

bool test_dequantize() {
  std::cout << "Testing dequantization...\n";

  const size_t rows = 8, cols = 256;
  WeightMatrix w(rows, cols);
  for (size_t i = 0; i < w.data.size(); ++i) {
    w.data[i] = std::sin(static_cast<float>(i) * 0.1f) * 0.5f;
  }

  QuantizedMatrix q = quantize_matrix(w);
  std::vector<float> reconstructed = dequantize_matrix(q);

  if (reconstructed.size() != rows * cols) {
    std::cerr << "FAIL: Wrong reconstructed size\n";
    return false;
  }

  float mse = 0.0f;
  for (size_t i = 0; i < w.data.size(); ++i) {
    float diff = w.data[i] - reconstructed[i];
    mse += diff * diff;
  }
  mse /= w.data.size();

  std::cout << "  Reconstruction MSE: " << mse << "\n";

  if (mse > 0.1f) {
    std::cerr << "FAIL: MSE too high\n";
    return false;
  }

  std::cout << "  ✓ Dequantization OK\n";
  return true;
}

bool test_statistics() {
  std::cout << "Testing statistics computation...\n";

  int8_t codes[] = {-1, 0, 0, 1, 1, 1, -2};
  float scales[] = {0.5f, 2.0f, 1.0f};

  QuantizationStats stats;
  stats.compute(codes, 7, scales, 3);

  if (stats.neg_count != 1 || stats.zero_count != 2 || stats.pos_count != 3 ||
      stats.other_count != 1) {
    std::cerr << "FAIL: Wrong histogram\n";
    return false;
  }
  if (stats.min_scale != 0.5f || stats.max_scale != 2.0f) {
    std::cerr << "FAIL: Wrong scale range\n";
    return false;
  }
  if (std::abs(stats.sparsity() - 2.0f / 7.0f) > 1e-6f) {
    std::cerr << "FAIL: Wrong sparsity " << stats.sparsity() << "\n";
    return false;
  }

  std::cout << "  ✓ Statistics OK\n";
  return true;
}

int main() {
  std::cout
      << "╔══════════════════════════════════════════════════════════════╗\n";
  std::cout
      << "║             TernPack Quantization Tests                      ║\n";
  std::cout
      << "╚══════════════════════════════════════════════════════════════╝\n\n";

  int passed = 0;
  int failed = 0;

  bool (*tests[])() = {test_ternary_quantization, test_tie_break,
                       test_row_scale,            test_quantization_range,
                       test_zero_row,             test_subnormal_row,
                       test_dequantize,           test_statistics};
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
