#pragma once

/**
 * TernPack: Ternary Weight Packing for Low-Bit LLM Inference
 *
 * Core type definitions and configuration structures.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ternpack {

// ============================================================================
// Constants
// ============================================================================

constexpr size_t CODES_PER_BYTE = 4;  // 2 bits per ternary code
constexpr size_t CODES_PER_WORD = 16; // 32-bit word
constexpr uint8_t CODE_OFFSET = 2;    // -1,0,+1 -> 1,2,3

constexpr size_t TILE_ROWS = 16;
constexpr size_t TILE_COLS = 32;

constexpr char TERNPACK_FORMAT_NAME[] = "ternpack";
constexpr uint32_t TERNPACK_FORMAT_VERSION = 1;

// ============================================================================
// Matrix Types
// ============================================================================

/**
 * Dense FP32 matrix, row-major.
 */
struct WeightMatrix {
  size_t rows = 0;
  size_t cols = 0;
  std::vector<float> data;

  WeightMatrix() = default;
  WeightMatrix(size_t r, size_t c) : rows(r), cols(c), data(r * c, 0.0f) {}

  const float *row(size_t r) const { return data.data() + r * cols; }
  float *row(size_t r) { return data.data() + r * cols; }
  size_t num_elements() const { return rows * cols; }
};

/**
 * Ternary codes {-1, 0, +1}, one int8 per weight, plus one scale per row.
 */
struct QuantizedMatrix {
  size_t rows = 0;
  size_t cols = 0;
  std::vector<int8_t> codes; // rows * cols
  std::vector<float> scales; // rows

  const int8_t *row(size_t r) const { return codes.data() + r * cols; }
};

/**
 * 2-bit packed ternary codes.
 *
 * Each row is padded independently to words_per_row words. Field j of a
 * word (bits 2j..2j+1) holds code + 2 for column 16*w + j.
 */
struct PackedMatrix {
  size_t rows = 0;
  size_t cols = 0; // Logical column count before padding
  size_t words_per_row = 0;
  std::vector<uint32_t> words; // rows * words_per_row

  const uint32_t *row(size_t r) const {
    return words.data() + r * words_per_row;
  }
};

// ============================================================================
// Records
// ============================================================================

struct BitLinearRecord {
  PackedMatrix weight;
  std::vector<float> scales;
};

struct RmsNormRecord {
  std::vector<float> weight; // Canonical shape [N]
};

struct EmbeddingRecord {
  WeightMatrix weight;
};

struct TransformerBlockRecord {
  size_t layer_idx = 0;
  bool tile_permuted = false;

  // Attention
  BitLinearRecord qkv_proj;
  BitLinearRecord o_proj;

  // Feed-forward
  BitLinearRecord gate_up_proj;
  BitLinearRecord down_proj;

  RmsNormRecord attention_norm;
  RmsNormRecord ffn_norm;
};

struct ModelRecord {
  EmbeddingRecord embedding;
  std::vector<TransformerBlockRecord> blocks;
  RmsNormRecord norm;
  EmbeddingRecord lm_head;
};

// ============================================================================
// Model Configuration
// ============================================================================

struct ModelConfig {
  std::string model_type = "llama";

  size_t num_hidden_layers = 0; // Required
  size_t vocab_size = 0;
  size_t hidden_size = 0;
  size_t intermediate_size = 0;
  size_t num_attention_heads = 0;
  size_t num_key_value_heads = 0;

  float rms_norm_eps = 1e-5f;
  float rope_theta = 10000.0f;

  bool tie_word_embeddings = false;
};

// ============================================================================
// Utility Functions
// ============================================================================

inline size_t div_ceil(size_t n, size_t d) { return (n + d - 1) / d; }

inline size_t shape_elements(const std::vector<size_t> &shape) {
  size_t n = 1;
  for (auto s : shape)
    n *= s;
  return n;
}

} // namespace ternpack
