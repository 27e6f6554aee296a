#include "ternpack/format.hpp"
#include "ternpack/packing.hpp"
#include "ternpack/quantize.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace ternpack;

namespace {

void print_shape(const std::vector<size_t> &shape) {
  std::cout << "[";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0)
      std::cout << ", ";
    std::cout << shape[i];
  }
  std::cout << "]";
}

bool print_bitlinear(const ComponentFile &component, const std::string &name) {
  BitLinearRecord record;
  std::string error;
  if (!get_bitlinear(component, name, record, error)) {
    std::cerr << "  " << name << ": " << error << std::endl;
    return false;
  }

  std::vector<int8_t> codes = unpack_matrix(record.weight);
  QuantizationStats stats;
  stats.compute(codes.data(), codes.size(), record.scales.data(),
                record.scales.size());

  std::cout << "  " << name << " [" << record.weight.rows << ", "
            << record.weight.cols << "]: -1=" << stats.neg_count
            << " 0=" << stats.zero_count << " +1=" << stats.pos_count
            << " scale=[" << stats.min_scale << ", " << stats.max_scale << "]"
            << std::endl;

  if (stats.other_count > 0) {
    std::cerr << "  " << name << ": " << stats.other_count
              << " fields outside {-1, 0, +1}" << std::endl;
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: ternpack-inspect <component.safetensors> [--unpack]"
              << std::endl;
    return 1;
  }

  std::string path = argv[1];
  bool unpack = argc > 2 && std::string(argv[2]) == "--unpack";

  ComponentFile component;
  std::string error;
  std::cout << "Loading " << path << "..." << std::endl;
  if (!load_component(path, component, error)) {
    std::cerr << "Error: " << error << std::endl;
    return 1;
  }

  std::cout << "Metadata:" << std::endl;
  for (const auto &kv : component.metadata) {
    std::cout << "  " << kv.first << " = " << kv.second << std::endl;
  }

  std::cout << "Tensors (" << component.tensors.size() << "):" << std::endl;
  std::vector<std::string> linears;
  for (const auto &t : component.tensors) {
    std::cout << "  " << t.name << " ";
    print_shape(t.shape);
    std::cout << std::endl;

    const std::string suffix = ".packed";
    if (t.name.size() > suffix.size() &&
        t.name.compare(t.name.size() - suffix.size(), suffix.size(),
                       suffix) == 0) {
      linears.push_back(t.name.substr(0, t.name.size() - suffix.size()));
    }
  }

  if (!unpack)
    return 0;

  std::cout << "Ternary codes:" << std::endl;
  bool ok = true;
  for (const auto &name : linears) {
    ok = print_bitlinear(component, name) && ok;
  }
  return ok ? 0 : 1;
}
