/**
 * TernPack: Format Implementation
 *
 * Save/load component files through safetensors-cpp, plus the manifest.
 */

#include "ternpack/format.hpp"
#include "ternpack/config.hpp"
#include "ternpack/float_channel.hpp"
#include "ternpack/log.hpp"
#include "ternpack/packing.hpp"
#include "safetensors.hh"
#include <cstring>
#include <exception>
#include <fstream>
#include <iterator>
#include <sstream>

namespace ternpack {

namespace {

const char *const QKV_PROJ = "attention.qkv_proj";
const char *const O_PROJ = "attention.o_proj";
const char *const GATE_UP_PROJ = "feed_forward.gate_up_proj";
const char *const DOWN_PROJ = "feed_forward.down_proj";
const char *const ATTENTION_NORM = "attention_norm.weight";
const char *const FFN_NORM = "ffn_norm.weight";

void add_format_metadata(ComponentFile &component, const std::string &name) {
  component.metadata.emplace_back("format", TERNPACK_FORMAT_NAME);
  component.metadata.emplace_back("format_version",
                                  std::to_string(TERNPACK_FORMAT_VERSION));
  component.metadata.emplace_back("component", name);
}

bool check_format(const ComponentFile &component, const std::string &path,
                  std::string &error) {
  if (component.meta("format") != TERNPACK_FORMAT_NAME) {
    error = path + " is not a ternpack component file";
    return false;
  }
  if (component.meta("format_version") !=
      std::to_string(TERNPACK_FORMAT_VERSION)) {
    error = path + ": unsupported format version '" +
            component.meta("format_version") + "'";
    return false;
  }
  return true;
}

bool parse_size(const std::string &s, size_t &out) {
  if (s.empty() || s[0] == '-')
    return false;
  try {
    size_t consumed = 0;
    out = static_cast<size_t>(std::stoull(s, &consumed));
    return consumed == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool get_vector(const ComponentFile &component, const std::string &name,
                std::vector<float> &out, std::string &error) {
  const StoredTensor *t = component.find(name);
  if (!t) {
    error = "missing tensor " + name;
    return false;
  }
  if (t->shape.size() != 1) {
    error = "tensor " + name + " must be 1-D";
    return false;
  }
  out = t->data;
  return true;
}

} // namespace

// ============================================================================
// ComponentFile
// ============================================================================

const StoredTensor *ComponentFile::find(const std::string &name) const {
  for (const auto &t : tensors) {
    if (t.name == name)
      return &t;
  }
  return nullptr;
}

std::string ComponentFile::meta(const std::string &key) const {
  for (const auto &kv : metadata) {
    if (kv.first == key)
      return kv.second;
  }
  return "";
}

bool save_component(const std::string &path, const ComponentFile &component,
                    std::string &error) {
  safetensors::safetensors_t st;

  size_t total_bytes = 0;
  for (const auto &t : component.tensors) {
    if (t.data.size() != shape_elements(t.shape)) {
      error = "tensor " + t.name + ": " + std::to_string(t.data.size()) +
              " values do not match its shape";
      return false;
    }
    total_bytes += t.data.size() * sizeof(float);
  }

  st.storage.resize(total_bytes);
  size_t offset = 0;
  for (const auto &t : component.tensors) {
    size_t nbytes = t.data.size() * sizeof(float);

    safetensors::tensor_t tensor;
    tensor.dtype = safetensors::kFLOAT32;
    tensor.shape = t.shape;
    tensor.data_offsets[0] = offset;
    tensor.data_offsets[1] = offset + nbytes;

    // Raw bytes: packed words must keep every bit
    if (nbytes > 0)
      std::memcpy(st.storage.data() + offset, t.data.data(), nbytes);

    st.tensors.insert(t.name, tensor);
    offset += nbytes;
  }

  for (const auto &kv : component.metadata) {
    st.metadata.insert(kv.first, kv.second);
  }

  std::string warn;
  std::string err;
  if (!safetensors::save_to_file(st, path, &warn, &err)) {
    error = "cannot write " + path + ": " + err;
    return false;
  }
  if (!warn.empty())
    log_warn(path + ": " + warn);
  return true;
}

bool load_component(const std::string &path, ComponentFile &component,
                    std::string &error) {
  safetensors::safetensors_t st;
  std::string warn;
  std::string err;

  if (!safetensors::mmap_from_file(path, &st, &warn, &err)) {
    error = "cannot read " + path + ": " + err;
    return false;
  }
  if (!warn.empty())
    log_warn(path + ": " + warn);

  const uint8_t *databuffer = st.mmaped ? st.databuffer_addr : st.storage.data();

  component = ComponentFile();
  for (const auto &key : st.metadata.keys()) {
    std::string value;
    if (st.metadata.at(key, &value))
      component.metadata.emplace_back(key, value);
  }

  for (const auto &name : st.tensors.keys()) {
    safetensors::tensor_t tensor;
    if (!st.tensors.at(name, &tensor)) {
      error = "Failed to get tensor: " + name + " (" + path + ")";
      return false;
    }
    if (tensor.dtype != safetensors::kFLOAT32) {
      error = path + ": tensor " + name + " is not float32";
      return false;
    }

    StoredTensor t;
    t.name = name;
    t.shape = tensor.shape;
    size_t n = shape_elements(t.shape);
    size_t nbytes = tensor.data_offsets[1] - tensor.data_offsets[0];
    if (nbytes != n * sizeof(float)) {
      error = path + ": tensor " + name + " has " + std::to_string(nbytes) +
              " bytes, expected " + std::to_string(n * sizeof(float));
      return false;
    }

    t.data.resize(n);
    if (n > 0)
      std::memcpy(t.data.data(), databuffer + tensor.data_offsets[0], nbytes);
    component.tensors.push_back(std::move(t));
  }

  return true;
}

std::string block_file_name(size_t layer) {
  return "block_" + std::to_string(layer) + ".safetensors";
}

// ============================================================================
// BitLinear
// ============================================================================

void add_bitlinear(ComponentFile &component, const std::string &name,
                   const BitLinearRecord &record) {
  const PackedMatrix &w = record.weight;

  StoredTensor packed;
  packed.name = name + ".packed";
  packed.shape = {w.rows, w.words_per_row};
  packed.data = words_to_floats(w.words);
  component.tensors.push_back(std::move(packed));

  StoredTensor scales;
  scales.name = name + ".scales";
  scales.shape = {record.scales.size()};
  scales.data = record.scales;
  component.tensors.push_back(std::move(scales));

  component.metadata.emplace_back(name + ".cols", std::to_string(w.cols));
}

bool get_bitlinear(const ComponentFile &component, const std::string &name,
                   BitLinearRecord &record, std::string &error) {
  const StoredTensor *packed = component.find(name + ".packed");
  if (!packed) {
    error = "missing tensor " + name + ".packed";
    return false;
  }
  if (packed->shape.size() != 2) {
    error = "tensor " + name + ".packed must be 2-D";
    return false;
  }

  size_t cols = 0;
  if (!parse_size(component.meta(name + ".cols"), cols)) {
    error = "missing or invalid metadata " + name + ".cols";
    return false;
  }

  PackedMatrix &w = record.weight;
  w.rows = packed->shape[0];
  w.words_per_row = packed->shape[1];
  w.cols = cols;
  if (w.words_per_row != packed_words(cols)) {
    error = "tensor " + name + ".packed has " +
            std::to_string(w.words_per_row) + " words per row, expected " +
            std::to_string(packed_words(cols)) + " for " +
            std::to_string(cols) + " columns";
    return false;
  }
  w.words = floats_to_words(packed->data);

  if (!get_vector(component, name + ".scales", record.scales, error))
    return false;
  if (record.scales.size() != w.rows) {
    error = "tensor " + name + ".scales has " +
            std::to_string(record.scales.size()) + " entries, expected " +
            std::to_string(w.rows);
    return false;
  }
  return true;
}

// ============================================================================
// Records
// ============================================================================

bool save_embedding_record(const std::string &path,
                           const std::string &component_name,
                           const EmbeddingRecord &record, std::string &error) {
  ComponentFile component;
  add_format_metadata(component, component_name);

  StoredTensor t;
  t.name = "weight";
  t.shape = {record.weight.rows, record.weight.cols};
  t.data = record.weight.data;
  component.tensors.push_back(std::move(t));

  return save_component(path, component, error);
}

bool load_embedding_record(const std::string &path, EmbeddingRecord &record,
                           std::string &error) {
  ComponentFile component;
  if (!load_component(path, component, error) ||
      !check_format(component, path, error))
    return false;

  const StoredTensor *t = component.find("weight");
  if (!t || t->shape.size() != 2) {
    error = path + ": missing 2-D tensor 'weight'";
    return false;
  }
  record.weight.rows = t->shape[0];
  record.weight.cols = t->shape[1];
  record.weight.data = t->data;
  return true;
}

bool save_norm_record(const std::string &path, const RmsNormRecord &record,
                      std::string &error) {
  ComponentFile component;
  add_format_metadata(component, "norm");

  StoredTensor t;
  t.name = "weight";
  t.shape = {record.weight.size()};
  t.data = record.weight;
  component.tensors.push_back(std::move(t));

  return save_component(path, component, error);
}

bool load_norm_record(const std::string &path, RmsNormRecord &record,
                      std::string &error) {
  ComponentFile component;
  if (!load_component(path, component, error) ||
      !check_format(component, path, error))
    return false;
  if (!get_vector(component, "weight", record.weight, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

ComponentFile make_block_component(const TransformerBlockRecord &block) {
  ComponentFile component;
  add_format_metadata(component, "block");
  component.metadata.emplace_back("layer_index",
                                  std::to_string(block.layer_idx));
  component.metadata.emplace_back("tile_permuted",
                                  block.tile_permuted ? "1" : "0");

  add_bitlinear(component, QKV_PROJ, block.qkv_proj);
  add_bitlinear(component, O_PROJ, block.o_proj);
  add_bitlinear(component, GATE_UP_PROJ, block.gate_up_proj);
  add_bitlinear(component, DOWN_PROJ, block.down_proj);

  StoredTensor attn_norm;
  attn_norm.name = ATTENTION_NORM;
  attn_norm.shape = {block.attention_norm.weight.size()};
  attn_norm.data = block.attention_norm.weight;
  component.tensors.push_back(std::move(attn_norm));

  StoredTensor ffn_norm;
  ffn_norm.name = FFN_NORM;
  ffn_norm.shape = {block.ffn_norm.weight.size()};
  ffn_norm.data = block.ffn_norm.weight;
  component.tensors.push_back(std::move(ffn_norm));

  return component;
}

bool save_block_record(const std::string &path,
                       const TransformerBlockRecord &block, std::string &error) {
  return save_component(path, make_block_component(block), error);
}

bool load_block_record(const std::string &path, TransformerBlockRecord &block,
                       std::string &error) {
  ComponentFile component;
  if (!load_component(path, component, error) ||
      !check_format(component, path, error))
    return false;

  block = TransformerBlockRecord();
  if (!parse_size(component.meta("layer_index"), block.layer_idx)) {
    error = path + ": missing or invalid metadata layer_index";
    return false;
  }
  block.tile_permuted = component.meta("tile_permuted") == "1";

  if (!get_bitlinear(component, QKV_PROJ, block.qkv_proj, error) ||
      !get_bitlinear(component, O_PROJ, block.o_proj, error) ||
      !get_bitlinear(component, GATE_UP_PROJ, block.gate_up_proj, error) ||
      !get_bitlinear(component, DOWN_PROJ, block.down_proj, error) ||
      !get_vector(component, ATTENTION_NORM, block.attention_norm.weight,
                  error) ||
      !get_vector(component, FFN_NORM, block.ffn_norm.weight, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

// ============================================================================
// Manifest
// ============================================================================

bool save_manifest(const std::string &path, const Manifest &manifest,
                   std::string &error) {
  std::ofstream file(path);
  if (!file) {
    error = "cannot write " + path;
    return false;
  }

  file << "{\n";
  file << "  \"format\": \"" << TERNPACK_FORMAT_NAME << "\",\n";
  file << "  \"format_version\": " << TERNPACK_FORMAT_VERSION << ",\n";
  file << "  \"tile_permuted\": " << (manifest.tile_permuted ? "true" : "false")
       << ",\n";
  file << "  \"config\": " << serialize_config(manifest.config) << ",\n";
  file << "  \"components\": [\n";
  for (size_t i = 0; i < manifest.files.size(); ++i) {
    file << "    {\"file\": \"" << json::escape(manifest.files[i]) << "\"}";
    if (i < manifest.files.size() - 1)
      file << ",";
    file << "\n";
  }
  file << "  ]\n";
  file << "}\n";

  if (!file.good()) {
    error = "failed writing " + path;
    return false;
  }
  return true;
}

bool load_manifest(const std::string &path, Manifest &manifest,
                   std::string &error) {
  std::ifstream f(path);
  if (!f.good()) {
    error = "cannot read " + path;
    return false;
  }
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());

  if (json::find_value(content, "format") != TERNPACK_FORMAT_NAME) {
    error = path + " is not a ternpack manifest";
    return false;
  }

  manifest = Manifest();
  if (!parse_model_config(content, manifest.config, error)) {
    error = path + ": " + error;
    return false;
  }
  manifest.tile_permuted = json::find_value(content, "tile_permuted") == "true";

  const std::string key = "\"file\": \"";
  size_t pos = content.find(key);
  while (pos != std::string::npos) {
    size_t start = pos + key.size();
    size_t end = json::find_string_end(content, start);
    if (end == std::string::npos) {
      error = path + ": unterminated component file name";
      return false;
    }
    manifest.files.push_back(
        json::unescape(content.substr(start, end - start)));
    pos = content.find(key, end);
  }
  return true;
}

bool save_model(const std::string &dir, const ModelConfig &config,
                const ModelRecord &model, std::string &error) {
  auto join = [&dir](const std::string &file) { return dir + "/" + file; };

  Manifest manifest;
  manifest.config = config;
  manifest.tile_permuted = !model.blocks.empty() && model.blocks[0].tile_permuted;

  if (!save_embedding_record(join(EMBEDDING_FILE), "embedding",
                             model.embedding, error))
    return false;
  manifest.files.push_back(EMBEDDING_FILE);

  if (!save_norm_record(join(NORM_FILE), model.norm, error))
    return false;
  manifest.files.push_back(NORM_FILE);

  if (!save_embedding_record(join(LM_HEAD_FILE), "lm_head", model.lm_head,
                             error))
    return false;
  manifest.files.push_back(LM_HEAD_FILE);

  for (const auto &block : model.blocks) {
    std::string file = block_file_name(block.layer_idx);
    if (!save_block_record(join(file), block, error))
      return false;
    manifest.files.push_back(file);
    log_debug("  Saved " + file);
  }

  return save_manifest(join(MANIFEST_FILE), manifest, error);
}

} // namespace ternpack
