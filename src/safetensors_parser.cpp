/**
 * TernPack: Safetensors Loading
 *
 * This translation unit also carries the safetensors-cpp implementation.
 */

#define SAFETENSORS_CPP_IMPLEMENTATION
#include "safetensors.hh"

#include "ternpack/log.hpp"
#include "ternpack/safetensors_parser.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace ternpack {

namespace {

std::string shape_to_string(const std::vector<size_t> &shape) {
  std::string s = "[";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0)
      s += ", ";
    s += std::to_string(shape[i]);
  }
  return s + "]";
}

} // namespace

bool load_safetensors(const std::string &path, safetensors::dtype accepted_dtype,
                      TensorMap &tensors, std::string &error) {
  safetensors::safetensors_t st;
  std::string warn;
  std::string err;

  if (!safetensors::mmap_from_file(path, &st, &warn, &err)) {
    error = "cannot read safetensors file " + path + ": " + err;
    return false;
  }
  if (!warn.empty())
    log_warn(path + ": " + warn);

  const uint8_t *databuffer = st.mmaped ? st.databuffer_addr : st.storage.data();

  size_t skipped = 0;
  for (const auto &name : st.tensors.keys()) {
    safetensors::tensor_t tensor;
    if (!st.tensors.at(name, &tensor)) {
      error = "Failed to get tensor: " + name + " (" + path + ")";
      return false;
    }

    if (tensor.dtype != accepted_dtype) {
      log_warn("skipping tensor " + name + ": dtype " +
               dtype_to_string(tensor.dtype) + " is not " +
               dtype_to_string(accepted_dtype));
      skipped++;
      continue;
    }
    if (tensor.shape.size() != 1 && tensor.shape.size() != 2) {
      log_warn("skipping tensor " + name + ": rank " +
               std::to_string(tensor.shape.size()) + " " +
               shape_to_string(tensor.shape) + " is not 1 or 2");
      skipped++;
      continue;
    }

    if (tensors.count(name)) {
      error = "duplicate tensor " + name + " in " + path;
      return false;
    }

    LoadedTensor loaded;
    loaded.name = name;
    loaded.shape = tensor.shape;
    loaded.original_dtype = tensor.dtype;

    size_t num_elements = loaded.num_elements();
    size_t elem_bytes = safetensors::get_dtype_bytes(tensor.dtype);
    size_t data_size = tensor.data_offsets[1] - tensor.data_offsets[0];
    if (data_size != num_elements * elem_bytes) {
      error = "tensor " + name + " in " + path + " has " +
              std::to_string(data_size) + " bytes, expected " +
              std::to_string(num_elements * elem_bytes);
      return false;
    }

    // Get data pointer
    const uint8_t *data_ptr = databuffer + tensor.data_offsets[0];

    // Convert to float32
    loaded.data.resize(num_elements);

    switch (tensor.dtype) {
    case safetensors::kFLOAT32: {
      if (num_elements > 0)
        std::memcpy(loaded.data.data(), data_ptr, num_elements * sizeof(float));
      break;
    }
    case safetensors::kFLOAT16: {
      for (size_t i = 0; i < num_elements; ++i) {
        uint16_t h;
        std::memcpy(&h, data_ptr + i * sizeof(uint16_t), sizeof(h));
        loaded.data[i] = safetensors::fp16_to_float(h);
      }
      break;
    }
    case safetensors::kBFLOAT16: {
      for (size_t i = 0; i < num_elements; ++i) {
        uint16_t h;
        std::memcpy(&h, data_ptr + i * sizeof(uint16_t), sizeof(h));
        loaded.data[i] = safetensors::bfloat16_to_float(h);
      }
      break;
    }
    default:
      error = "Unsupported dtype for tensor: " + name;
      return false;
    }

    tensors.emplace(name, std::move(loaded));
  }

  log_debug("Loaded " + path + " (" + std::to_string(skipped) +
            " tensors skipped)");
  return true;
}

bool load_safetensors_dir(const std::string &dir,
                          safetensors::dtype accepted_dtype,
                          TensorMap &tensors, std::string &error) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    error = "input directory not found: " + dir;
    return false;
  }

  std::vector<std::string> files;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec) &&
        it->path().extension() == ".safetensors")
      files.push_back(it->path().string());
  }
  if (ec) {
    error = "cannot list input directory " + dir + ": " + ec.message();
    return false;
  }
  if (files.empty()) {
    error = "no .safetensors files in " + dir;
    return false;
  }

  std::sort(files.begin(), files.end());
  for (const auto &file : files) {
    log_info("Loading " + file + "...");
    if (!load_safetensors(file, accepted_dtype, tensors, error))
      return false;
  }
  return true;
}

} // namespace ternpack
