#pragma once

/**
 * TernPack: Conversion Pipeline
 *
 * config.json + *.safetensors -> assembled records -> component files.
 */

#include "types.hpp"
#include <functional>
#include <string>

namespace ternpack {

struct ConvertOptions {
  std::string input_dir = "model";
  std::string output_dir;                // Empty = default_output_dir(input)
  std::string source_dtype = "float32";  // float32, float16 or bfloat16
  bool permute_tiles = false;
  bool verify = false;
};

struct ConvertSummary {
  ModelConfig config;
  std::string output_dir;
  size_t num_source_tensors = 0;
  size_t num_blocks = 0;
  size_t quantized_params = 0; // Weights that went through the ternary codec
  size_t plain_params = 0;     // Embeddings, head and norms
  size_t packed_bytes = 0;     // Packed words + scales
  double elapsed_seconds = 0.0;
};

std::string default_output_dir(const std::string &input_dir);

/**
 * Reload every component written for `model` from `dir` and compare it bit
 * for bit with the in-memory records.
 */
bool verify_saved_model(const std::string &dir, const ModelRecord &model,
                        std::string &error);

/**
 * Run one stage of the pipeline. Anything the stage throws, std::exception or
 * not, becomes a "conversion failed: ..." message in `error`.
 */
bool run_guarded(const std::function<bool(std::string &)> &stage,
                 std::string &error);

/**
 * Run the whole conversion. Any failure, including an exception escaping a
 * stage, is reported through `error`; nothing is thrown.
 */
bool convert_model(const ConvertOptions &options, ConvertSummary &summary,
                   std::string &error);

} // namespace ternpack
