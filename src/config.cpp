/**
 * TernPack: Model Config Implementation
 */

#include "ternpack/config.hpp"
#include <exception>
#include <fstream>
#include <iterator>
#include <sstream>

namespace ternpack {

namespace json {

std::string escape(const std::string &s) {
  std::string result;
  for (char c : s) {
    if (c == '"')
      result += "\\\"";
    else if (c == '\\')
      result += "\\\\";
    else
      result += c;
  }
  return result;
}

std::string unescape(const std::string &s) {
  std::string result;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size())
      ++i;
    result += s[i];
  }
  return result;
}

size_t find_string_end(const std::string &json, size_t start) {
  for (size_t i = start; i < json.size(); ++i) {
    if (json[i] == '\\')
      ++i;
    else if (json[i] == '"')
      return i;
  }
  return std::string::npos;
}

std::string find_value(const std::string &json, const std::string &key) {
  size_t pos = json.find("\"" + key + "\"");
  if (pos == std::string::npos)
    return "";
  pos = json.find(":", pos + key.length() + 2);
  if (pos == std::string::npos)
    return "";

  size_t val_start = json.find_first_not_of(" \t\n\r", pos + 1);
  if (val_start == std::string::npos)
    return "";

  if (json[val_start] == '"') {
    size_t val_end = find_string_end(json, val_start + 1);
    if (val_end == std::string::npos)
      return "";
    return unescape(json.substr(val_start + 1, val_end - val_start - 1));
  }

  size_t val_end = json.find_first_of(",}]\n\r", val_start);
  if (val_end == std::string::npos)
    val_end = json.size();
  std::string val = json.substr(val_start, val_end - val_start);
  size_t last = val.find_last_not_of(" \t");
  return last == std::string::npos ? "" : val.substr(0, last + 1);
}

} // namespace json

namespace {

bool parse_size(const std::string &s, size_t &out) {
  if (s.empty() || s[0] == '-')
    return false;
  try {
    size_t consumed = 0;
    unsigned long long v = std::stoull(s, &consumed);
    if (consumed != s.size())
      return false;
    out = static_cast<size_t>(v);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_float(const std::string &s, float &out) {
  try {
    size_t consumed = 0;
    float v = std::stof(s, &consumed);
    if (consumed != s.size())
      return false;
    out = v;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

// Optional size_t key: absent or unparsable leaves the default in place.
void read_size(const std::string &content, const char *key, size_t &field) {
  size_t v = 0;
  if (parse_size(json::find_value(content, key), v))
    field = v;
}

void read_float(const std::string &content, const char *key, float &field) {
  float v = 0.0f;
  if (parse_float(json::find_value(content, key), v))
    field = v;
}

} // namespace

bool parse_model_config(const std::string &content, ModelConfig &config,
                        std::string &error) {
  std::string layers = json::find_value(content, "num_hidden_layers");
  if (layers.empty()) {
    error = "malformed config: missing \"num_hidden_layers\"";
    return false;
  }
  size_t num_layers = 0;
  if (!parse_size(layers, num_layers) || num_layers == 0) {
    error = "malformed config: \"num_hidden_layers\" must be a positive "
            "integer, got '" +
            layers + "'";
    return false;
  }
  config.num_hidden_layers = num_layers;

  std::string model_type = json::find_value(content, "model_type");
  if (!model_type.empty())
    config.model_type = model_type;

  read_size(content, "vocab_size", config.vocab_size);
  read_size(content, "hidden_size", config.hidden_size);
  read_size(content, "intermediate_size", config.intermediate_size);
  read_size(content, "num_attention_heads", config.num_attention_heads);
  read_size(content, "num_key_value_heads", config.num_key_value_heads);
  read_float(content, "rms_norm_eps", config.rms_norm_eps);
  read_float(content, "rope_theta", config.rope_theta);

  std::string tie = json::find_value(content, "tie_word_embeddings");
  if (tie == "true")
    config.tie_word_embeddings = true;
  else if (tie == "false")
    config.tie_word_embeddings = false;

  if (config.num_key_value_heads == 0)
    config.num_key_value_heads = config.num_attention_heads;

  return true;
}

bool load_model_config(const std::string &path, ModelConfig &config,
                       std::string &error) {
  std::ifstream f(path);
  if (!f.good()) {
    error = "cannot read config file: " + path;
    return false;
  }
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());

  if (!parse_model_config(content, config, error)) {
    error += " (" + path + ")";
    return false;
  }
  return true;
}

std::string serialize_config(const ModelConfig &config) {
  std::ostringstream ss;
  ss << "{\n";
  ss << "    \"model_type\": \"" << json::escape(config.model_type) << "\",\n";
  ss << "    \"num_hidden_layers\": " << config.num_hidden_layers << ",\n";
  ss << "    \"vocab_size\": " << config.vocab_size << ",\n";
  ss << "    \"hidden_size\": " << config.hidden_size << ",\n";
  ss << "    \"intermediate_size\": " << config.intermediate_size << ",\n";
  ss << "    \"num_attention_heads\": " << config.num_attention_heads << ",\n";
  ss << "    \"num_key_value_heads\": " << config.num_key_value_heads << ",\n";
  ss << "    \"rms_norm_eps\": " << config.rms_norm_eps << ",\n";
  ss << "    \"rope_theta\": " << config.rope_theta << ",\n";
  ss << "    \"tie_word_embeddings\": "
     << (config.tie_word_embeddings ? "true" : "false") << "\n";
  ss << "  }";
  return ss.str();
}

} // namespace ternpack
