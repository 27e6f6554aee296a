#pragma once

/**
 * TernPack: Model Assembler
 *
 * Maps named source tensors (Llama naming) to structured records, fusing
 * q/k/v and gate/up projections and running the ternary codec on every
 * projection matrix.
 */

#include "safetensors_parser.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace ternpack {

// Top-level tensor names
constexpr char EMBED_TOKENS_NAME[] = "model.embed_tokens.weight";
constexpr char FINAL_NORM_NAME[] = "model.norm.weight";
constexpr char LM_HEAD_NAME[] = "lm_head.weight";
constexpr char LM_HEAD_ALT_NAME[] = "output.weight";

struct AssembleOptions {
  bool permute_tiles = false; // Apply the 16x32 MMA tile layout before packing
  bool verify = false;        // Unpack every matrix and compare to its codes
};

/**
 * "model.layers.{layer}.{suffix}"
 */
std::string layer_tensor_name(size_t layer, const std::string &suffix);

/**
 * The nine tensors a layer must provide, in lookup order.
 */
std::vector<std::string> required_layer_tensors(size_t layer);

/**
 * Quantize, optionally tile-permute, and pack one projection matrix.
 * `name` only labels log lines and errors.
 */
bool build_bitlinear(const WeightMatrix &weights,
                     const AssembleOptions &options, BitLinearRecord &record,
                     std::string &error, const std::string &name = "");

/**
 * Stack rank-2 tensors along rows, in the given order.
 */
bool concat_rows(const std::vector<const LoadedTensor *> &parts,
                 WeightMatrix &out, std::string &error);

/**
 * Norm weights of shape [N], [1, N] or [N, 1] -> [N].
 */
bool canonicalize_norm(const LoadedTensor &tensor, RmsNormRecord &record,
                       std::string &error);

bool assemble_block(const TensorMap &tensors, size_t layer,
                    const AssembleOptions &options,
                    TransformerBlockRecord &block, std::string &error);

/**
 * Assemble the whole model, layers 0..config.num_hidden_layers-1 in order.
 * Any missing required tensor fails with an error naming that tensor.
 */
bool assemble_model(const TensorMap &tensors, const ModelConfig &config,
                    const AssembleOptions &options, ModelRecord &model,
                    std::string &error);

} // namespace ternpack
