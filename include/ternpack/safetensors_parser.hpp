#pragma once

/**
 * TernPack: Safetensors Parser Wrapper
 *
 * Wraps the safetensors-cpp library for source tensor extraction.
 */

#include "safetensors.hh"

#include "ternpack/types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace ternpack {

/**
 * Loaded source tensor with float data
 */
struct LoadedTensor {
  std::string name;
  std::vector<size_t> shape;
  std::vector<float> data;
  safetensors::dtype original_dtype = safetensors::kFLOAT32;

  size_t num_elements() const { return shape_elements(shape); }
};

using TensorMap = std::unordered_map<std::string, LoadedTensor>;

/**
 * Load the tensors of one safetensors file into `tensors`.
 *
 * Only tensors stored as `accepted_dtype` (float32, float16 or bfloat16) with
 * rank 1 or 2 are loaded; everything else is skipped with a warning. A name
 * already present in `tensors` is an error.
 */
bool load_safetensors(const std::string &path, safetensors::dtype accepted_dtype,
                      TensorMap &tensors, std::string &error);

/**
 * Load every *.safetensors file of a directory, in file name order.
 */
bool load_safetensors_dir(const std::string &dir,
                          safetensors::dtype accepted_dtype,
                          TensorMap &tensors, std::string &error);

/**
 * Get dtype name as string
 */
inline std::string dtype_to_string(safetensors::dtype dtype) {
  switch (dtype) {
  case safetensors::kBOOL:
    return "bool";
  case safetensors::kUINT8:
    return "uint8";
  case safetensors::kINT8:
    return "int8";
  case safetensors::kINT16:
    return "int16";
  case safetensors::kUINT16:
    return "uint16";
  case safetensors::kFLOAT16:
    return "float16";
  case safetensors::kBFLOAT16:
    return "bfloat16";
  case safetensors::kINT32:
    return "int32";
  case safetensors::kUINT32:
    return "uint32";
  case safetensors::kFLOAT32:
    return "float32";
  case safetensors::kFLOAT64:
    return "float64";
  case safetensors::kINT64:
    return "int64";
  case safetensors::kUINT64:
    return "uint64";
  default:
    return "unknown";
  }
}

/**
 * Parse a source dtype name. Only the floating-point widths the converter
 * accepts are recognized.
 */
inline bool parse_source_dtype(const std::string &name,
                               safetensors::dtype &dtype) {
  if (name == "float32" || name == "f32") {
    dtype = safetensors::kFLOAT32;
  } else if (name == "float16" || name == "f16") {
    dtype = safetensors::kFLOAT16;
  } else if (name == "bfloat16" || name == "bf16") {
    dtype = safetensors::kBFLOAT16;
  } else {
    return false;
  }
  return true;
}

} // namespace ternpack
