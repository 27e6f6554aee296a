/**
 * TernPack: Model Assembler Implementation
 */

#include "ternpack/assembler.hpp"
#include "ternpack/log.hpp"
#include "ternpack/packing.hpp"
#include "ternpack/quantize.hpp"
#include "ternpack/transform.hpp"
#include <sstream>

namespace ternpack {

namespace {

const char *const LAYER_SUFFIXES[] = {
    "self_attn.q_proj.weight",  "self_attn.k_proj.weight",
    "self_attn.v_proj.weight",  "self_attn.o_proj.weight",
    "mlp.gate_proj.weight",     "mlp.up_proj.weight",
    "mlp.down_proj.weight",     "input_layernorm.weight",
    "post_attention_layernorm.weight",
};

const LoadedTensor *find_tensor(const TensorMap &tensors,
                                const std::string &name) {
  auto it = tensors.find(name);
  return it == tensors.end() ? nullptr : &it->second;
}

std::string shape_str(const std::vector<size_t> &shape) {
  std::ostringstream ss;
  ss << "[";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0)
      ss << ", ";
    ss << shape[i];
  }
  ss << "]";
  return ss.str();
}

bool to_matrix(const LoadedTensor &t, WeightMatrix &out, std::string &error) {
  if (t.shape.size() != 2) {
    error = "tensor " + t.name + " must be 2-D, got shape " + shape_str(t.shape);
    return false;
  }
  out.rows = t.shape[0];
  out.cols = t.shape[1];
  out.data = t.data;
  return true;
}

void log_matrix_stats(const std::string &name, const QuantizedMatrix &q) {
  QuantizationStats stats;
  stats.compute(q.codes.data(), q.codes.size(), q.scales.data(),
                q.scales.size());
  std::ostringstream ss;
  ss << "  " << name << " [" << q.rows << ", " << q.cols << "]"
     << " sparsity=" << stats.sparsity() << " scale=[" << stats.min_scale
     << ", " << stats.max_scale << "]";
  log_debug(ss.str());
}

} // namespace

std::string layer_tensor_name(size_t layer, const std::string &suffix) {
  return "model.layers." + std::to_string(layer) + "." + suffix;
}

std::vector<std::string> required_layer_tensors(size_t layer) {
  std::vector<std::string> names;
  for (const char *suffix : LAYER_SUFFIXES)
    names.push_back(layer_tensor_name(layer, suffix));
  return names;
}

bool build_bitlinear(const WeightMatrix &weights,
                     const AssembleOptions &options, BitLinearRecord &record,
                     std::string &error, const std::string &name) {
  QuantizedMatrix q = quantize_matrix(weights);

  if (options.permute_tiles) {
    q.codes = permute_tiles(q.codes.data(), q.rows, q.cols);
  }

  record.weight = pack_matrix(q);
  record.scales = q.scales;

  if (options.verify) {
    std::vector<int8_t> unpacked = unpack_matrix(record.weight);
    for (size_t i = 0; i < unpacked.size(); ++i) {
      if (unpacked[i] != q.codes[i]) {
        std::ostringstream ss;
        ss << name << ": pack/unpack mismatch at element " << i << " (row "
           << i / q.cols << "): expected " << static_cast<int>(q.codes[i])
           << ", got " << static_cast<int>(unpacked[i]);
        error = ss.str();
        return false;
      }
    }
  }

  log_matrix_stats(name, q);
  return true;
}

bool concat_rows(const std::vector<const LoadedTensor *> &parts,
                 WeightMatrix &out, std::string &error) {
  out = WeightMatrix();
  if (parts.empty())
    return true;

  for (const LoadedTensor *p : parts) {
    if (p->shape.size() != 2) {
      error = "tensor " + p->name + " must be 2-D, got shape " +
              shape_str(p->shape);
      return false;
    }
    if (p->shape[1] != parts[0]->shape[1]) {
      error = "tensor " + p->name + " has " + std::to_string(p->shape[1]) +
              " columns, expected " + std::to_string(parts[0]->shape[1]) +
              " to match " + parts[0]->name;
      return false;
    }
    out.rows += p->shape[0];
  }

  out.cols = parts[0]->shape[1];
  out.data.reserve(out.rows * out.cols);
  for (const LoadedTensor *p : parts) {
    out.data.insert(out.data.end(), p->data.begin(), p->data.end());
  }
  return true;
}

bool canonicalize_norm(const LoadedTensor &tensor, RmsNormRecord &record,
                       std::string &error) {
  const auto &s = tensor.shape;
  bool ok = s.size() == 1 || (s.size() == 2 && (s[0] == 1 || s[1] == 1));
  if (!ok) {
    error = "norm tensor " + tensor.name + " has shape " + shape_str(s) +
            ", expected [N], [1, N] or [N, 1]";
    return false;
  }
  // Row-major [1, N] and [N, 1] share the element order of [N]
  record.weight = tensor.data;
  return true;
}

bool assemble_block(const TensorMap &tensors, size_t layer,
                    const AssembleOptions &options,
                    TransformerBlockRecord &block, std::string &error) {
  // Resolve every required tensor before doing any work on the layer
  std::vector<const LoadedTensor *> t;
  for (const auto &name : required_layer_tensors(layer)) {
    const LoadedTensor *p = find_tensor(tensors, name);
    if (!p) {
      error = "missing required tensor: " + name;
      return false;
    }
    t.push_back(p);
  }

  const LoadedTensor *q_proj = t[0], *k_proj = t[1], *v_proj = t[2],
                     *o_proj = t[3], *gate_proj = t[4], *up_proj = t[5],
                     *down_proj = t[6], *input_norm = t[7],
                     *post_attn_norm = t[8];

  block = TransformerBlockRecord();
  block.layer_idx = layer;
  block.tile_permuted = options.permute_tiles;

  WeightMatrix qkv, gate_up, o, down;
  if (!concat_rows({q_proj, k_proj, v_proj}, qkv, error) ||
      !concat_rows({gate_proj, up_proj}, gate_up, error) ||
      !to_matrix(*o_proj, o, error) || !to_matrix(*down_proj, down, error))
    return false;

  std::string prefix = "layer " + std::to_string(layer) + " ";
  if (!build_bitlinear(qkv, options, block.qkv_proj, error,
                       prefix + "qkv_proj") ||
      !build_bitlinear(o, options, block.o_proj, error, prefix + "o_proj") ||
      !build_bitlinear(gate_up, options, block.gate_up_proj, error,
                       prefix + "gate_up_proj") ||
      !build_bitlinear(down, options, block.down_proj, error,
                       prefix + "down_proj"))
    return false;

  if (!canonicalize_norm(*input_norm, block.attention_norm, error) ||
      !canonicalize_norm(*post_attn_norm, block.ffn_norm, error))
    return false;

  return true;
}

bool assemble_model(const TensorMap &tensors, const ModelConfig &config,
                    const AssembleOptions &options, ModelRecord &model,
                    std::string &error) {
  model = ModelRecord();

  const LoadedTensor *embed = find_tensor(tensors, EMBED_TOKENS_NAME);
  if (!embed) {
    error = std::string("missing required tensor: ") + EMBED_TOKENS_NAME;
    return false;
  }
  if (!to_matrix(*embed, model.embedding.weight, error))
    return false;

  const LoadedTensor *norm = find_tensor(tensors, FINAL_NORM_NAME);
  if (!norm) {
    error = std::string("missing required tensor: ") + FINAL_NORM_NAME;
    return false;
  }
  if (!canonicalize_norm(*norm, model.norm, error))
    return false;

  const LoadedTensor *head = find_tensor(tensors, LM_HEAD_NAME);
  if (!head)
    head = find_tensor(tensors, LM_HEAD_ALT_NAME);
  if (head) {
    if (!to_matrix(*head, model.lm_head.weight, error))
      return false;
  } else if (config.tie_word_embeddings) {
    log_info("Note: lm_head not found, using tied embed_tokens");
    model.lm_head.weight = model.embedding.weight;
  } else {
    error = std::string("missing required tensor: ") + LM_HEAD_NAME;
    return false;
  }

  const size_t num_layers = config.num_hidden_layers;
  model.blocks.reserve(num_layers);
  for (size_t i = 0; i < num_layers; ++i) {
    TransformerBlockRecord block;
    if (!assemble_block(tensors, i, options, block, error))
      return false;
    model.blocks.push_back(std::move(block));
    log_info("  Assembled layer " + std::to_string(i + 1) + "/" +
             std::to_string(num_layers));
  }

  return true;
}

} // namespace ternpack
