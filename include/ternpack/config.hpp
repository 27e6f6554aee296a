#pragma once

/**
 * TernPack: Model Config
 *
 * Reads the handful of keys the converter needs from a HuggingFace-style
 * config.json. Only num_hidden_layers is required.
 */

#include "types.hpp"
#include <cstddef>
#include <string>

namespace ternpack {

namespace json {

std::string escape(const std::string &s);

/**
 * Inverse of escape(): \" -> ", \\ -> \, any other \c -> c.
 */
std::string unescape(const std::string &s);

/**
 * Index of the closing quote of a string literal whose contents start at
 * `start`, skipping escaped quotes. npos if unterminated.
 */
size_t find_string_end(const std::string &json, size_t start);

/**
 * Text of the value for "key", or "" if the key is absent. String values are
 * returned without quotes and unescaped.
 */
std::string find_value(const std::string &json, const std::string &key);

} // namespace json

bool parse_model_config(const std::string &content, ModelConfig &config,
                        std::string &error);

bool load_model_config(const std::string &path, ModelConfig &config,
                       std::string &error);

std::string serialize_config(const ModelConfig &config);

} // namespace ternpack
