#pragma once

/**
 * TernPack: File Format
 *
 * One .safetensors file per structural unit, all tensors F32:
 *
 *   embedding.safetensors   weight [V, H]
 *   norm.safetensors        weight [H]
 *   lm_head.safetensors     weight [V, H]
 *   block_{i}.safetensors   attention.qkv_proj.packed     [n, ceil(k/16)]
 *                           attention.qkv_proj.scales     [n]
 *                           attention.o_proj.{packed,scales}
 *                           feed_forward.gate_up_proj.{packed,scales}
 *                           feed_forward.down_proj.{packed,scales}
 *                           attention_norm.weight         [H]
 *                           ffn_norm.weight               [H]
 *   manifest.json           config + component list, written last
 *
 * *.packed tensors hold packed uint32 words bit-cast to float (see
 * float_channel.hpp). __metadata__ carries format, format_version,
 * component, and for blocks layer_index, tile_permuted and <linear>.cols.
 */

#include "types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace ternpack {

/**
 * F32 tensor as stored in a component file
 */
struct StoredTensor {
  std::string name;
  std::vector<size_t> shape;
  std::vector<float> data;
};

/**
 * Contents of one component file
 */
struct ComponentFile {
  std::vector<std::pair<std::string, std::string>> metadata;
  std::vector<StoredTensor> tensors;

  const StoredTensor *find(const std::string &name) const;
  std::string meta(const std::string &key) const; // "" if absent
};

bool save_component(const std::string &path, const ComponentFile &component,
                    std::string &error);

bool load_component(const std::string &path, ComponentFile &component,
                    std::string &error);

// Component file names
std::string block_file_name(size_t layer);
constexpr char EMBEDDING_FILE[] = "embedding.safetensors";
constexpr char NORM_FILE[] = "norm.safetensors";
constexpr char LM_HEAD_FILE[] = "lm_head.safetensors";
constexpr char MANIFEST_FILE[] = "manifest.json";

// Record <-> component conversion
void add_bitlinear(ComponentFile &component, const std::string &name,
                   const BitLinearRecord &record);
bool get_bitlinear(const ComponentFile &component, const std::string &name,
                   BitLinearRecord &record, std::string &error);

ComponentFile make_block_component(const TransformerBlockRecord &block);

// Record persistence
bool save_embedding_record(const std::string &path,
                           const std::string &component_name,
                           const EmbeddingRecord &record, std::string &error);
bool load_embedding_record(const std::string &path, EmbeddingRecord &record,
                           std::string &error);

bool save_norm_record(const std::string &path, const RmsNormRecord &record,
                      std::string &error);
bool load_norm_record(const std::string &path, RmsNormRecord &record,
                      std::string &error);

bool save_block_record(const std::string &path,
                       const TransformerBlockRecord &block, std::string &error);
bool load_block_record(const std::string &path, TransformerBlockRecord &block,
                       std::string &error);

/**
 * Manifest listing the config and every component file
 */
struct Manifest {
  ModelConfig config;
  bool tile_permuted = false;
  std::vector<std::string> files; // Component files, relative to the manifest
};

bool save_manifest(const std::string &path, const Manifest &manifest,
                   std::string &error);
bool load_manifest(const std::string &path, Manifest &manifest,
                   std::string &error);

/**
 * Write every component of a model into `dir`, then the manifest.
 */
bool save_model(const std::string &dir, const ModelConfig &config,
                const ModelRecord &model, std::string &error);

} // namespace ternpack
