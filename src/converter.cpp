/**
 * TernPack: Conversion Pipeline Implementation
 */

#include "ternpack/converter.hpp"
#include "ternpack/assembler.hpp"
#include "ternpack/config.hpp"
#include "ternpack/format.hpp"
#include "ternpack/log.hpp"
#include "ternpack/safetensors_parser.hpp"
#include <chrono>
#include <cstring>
#include <exception>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace ternpack {

namespace {

bool same_bits(const std::vector<float> &a, const std::vector<float> &b) {
  return a.size() == b.size() &&
         (a.empty() ||
          std::memcmp(a.data(), b.data(), a.size() * sizeof(float)) == 0);
}

bool same_bitlinear(const BitLinearRecord &a, const BitLinearRecord &b) {
  return a.weight.rows == b.weight.rows && a.weight.cols == b.weight.cols &&
         a.weight.words_per_row == b.weight.words_per_row &&
         a.weight.words == b.weight.words && same_bits(a.scales, b.scales);
}

void summarize(const ModelRecord &model, ConvertSummary &summary) {
  summary.num_blocks = model.blocks.size();
  summary.plain_params = model.embedding.weight.num_elements() +
                         model.lm_head.weight.num_elements() +
                         model.norm.weight.size();
  summary.quantized_params = 0;
  summary.packed_bytes = 0;

  for (const auto &block : model.blocks) {
    for (const BitLinearRecord *linear :
         {&block.qkv_proj, &block.o_proj, &block.gate_up_proj,
          &block.down_proj}) {
      summary.quantized_params += linear->weight.rows * linear->weight.cols;
      summary.packed_bytes += linear->weight.words.size() * sizeof(uint32_t) +
                              linear->scales.size() * sizeof(float);
    }
    summary.plain_params +=
        block.attention_norm.weight.size() + block.ffn_norm.weight.size();
  }
}

bool run_conversion(const ConvertOptions &options, ConvertSummary &summary,
                    std::string &error) {
  safetensors::dtype source_dtype;
  if (!parse_source_dtype(options.source_dtype, source_dtype)) {
    error = "unsupported source dtype '" + options.source_dtype +
            "' (expected float32, float16 or bfloat16)";
    return false;
  }

  summary.output_dir = options.output_dir.empty()
                           ? default_output_dir(options.input_dir)
                           : options.output_dir;

  // Config
  std::string config_path = options.input_dir + "/config.json";
  log_info("Loading config from " + config_path + "...");
  if (!load_model_config(config_path, summary.config, error))
    return false;
  log_info("  Layers: " + std::to_string(summary.config.num_hidden_layers));

  // Source tensors
  TensorMap tensors;
  if (!load_safetensors_dir(options.input_dir, source_dtype, tensors, error))
    return false;
  summary.num_source_tensors = tensors.size();
  log_info("Loaded " + std::to_string(tensors.size()) + " tensors");

  // Assemble
  AssembleOptions assemble_options;
  assemble_options.permute_tiles = options.permute_tiles;
  assemble_options.verify = options.verify;
  if (options.permute_tiles)
    log_info("Tile permutation: enabled (16x32 MMA layout)");

  log_info("Quantizing layers...");
  ModelRecord model;
  if (!assemble_model(tensors, summary.config, assemble_options, model, error))
    return false;

  // Source tensors are no longer needed
  TensorMap().swap(tensors);

  // Save
  std::error_code ec;
  std::filesystem::create_directories(summary.output_dir, ec);
  if (ec) {
    error = "cannot create output directory " + summary.output_dir + ": " +
            ec.message();
    return false;
  }

  log_info("Saving to: " + summary.output_dir);
  if (!save_model(summary.output_dir, summary.config, model, error))
    return false;

  if (options.verify) {
    log_info("Verifying written components...");
    if (!verify_saved_model(summary.output_dir, model, error))
      return false;
  }

  summarize(model, summary);
  return true;
}

} // namespace

std::string default_output_dir(const std::string &input_dir) {
  return input_dir + "/ternpack";
}

bool verify_saved_model(const std::string &dir, const ModelRecord &model,
                        std::string &error) {
  auto join = [&dir](const std::string &file) { return dir + "/" + file; };

  EmbeddingRecord embedding;
  if (!load_embedding_record(join(EMBEDDING_FILE), embedding, error))
    return false;
  if (!same_bits(embedding.weight.data, model.embedding.weight.data)) {
    error = std::string("verification failed: ") + EMBEDDING_FILE;
    return false;
  }

  RmsNormRecord norm;
  if (!load_norm_record(join(NORM_FILE), norm, error))
    return false;
  if (!same_bits(norm.weight, model.norm.weight)) {
    error = std::string("verification failed: ") + NORM_FILE;
    return false;
  }

  EmbeddingRecord lm_head;
  if (!load_embedding_record(join(LM_HEAD_FILE), lm_head, error))
    return false;
  if (!same_bits(lm_head.weight.data, model.lm_head.weight.data)) {
    error = std::string("verification failed: ") + LM_HEAD_FILE;
    return false;
  }

  for (const auto &expected : model.blocks) {
    std::string file = block_file_name(expected.layer_idx);
    TransformerBlockRecord block;
    if (!load_block_record(join(file), block, error))
      return false;

    bool ok = block.layer_idx == expected.layer_idx &&
              block.tile_permuted == expected.tile_permuted &&
              same_bitlinear(block.qkv_proj, expected.qkv_proj) &&
              same_bitlinear(block.o_proj, expected.o_proj) &&
              same_bitlinear(block.gate_up_proj, expected.gate_up_proj) &&
              same_bitlinear(block.down_proj, expected.down_proj) &&
              same_bits(block.attention_norm.weight,
                        expected.attention_norm.weight) &&
              same_bits(block.ffn_norm.weight, expected.ffn_norm.weight);
    if (!ok) {
      error = "verification failed: " + file;
      return false;
    }
  }
  return true;
}

bool run_guarded(const std::function<bool(std::string &)> &stage,
                 std::string &error) {
  try {
    return stage(error);
  } catch (const std::exception &e) {
    error = std::string("conversion failed: ") + e.what();
  } catch (...) {
    error = "conversion failed: unknown error";
  }
  return false;
}

bool convert_model(const ConvertOptions &options, ConvertSummary &summary,
                   std::string &error) {
  auto start_time = std::chrono::steady_clock::now();

  bool ok = run_guarded(
      [&](std::string &stage_error) {
        return run_conversion(options, summary, stage_error);
      },
      error);

  auto end_time = std::chrono::steady_clock::now();
  summary.elapsed_seconds =
      std::chrono::duration<double>(end_time - start_time).count();
  return ok;
}

} // namespace ternpack
