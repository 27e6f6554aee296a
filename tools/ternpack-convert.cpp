/**
 * TernPack Conversion Tool
 *
 * Convert a safetensors model directory to packed ternary component files.
 *
 * Usage:
 *   ternpack-convert --input models/llama --output models/llama/ternpack
 */

#include "ternpack/converter.hpp"
#include "ternpack/log.hpp"
#include "ternpack/types.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

using namespace ternpack;

void print_usage(const char *prog) {
  std::cout << "TernPack Conversion Tool v" << TERNPACK_FORMAT_VERSION
            << "\n\n";
  std::cout << "Usage: " << prog << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --input, -i <dir>       Model directory with config.json and "
               "*.safetensors (default: ./model)\n";
  std::cout << "  --output, -o <dir>      Output directory (default: "
               "<input>/ternpack)\n";
  std::cout << "  --source-dtype <type>   Source storage width: float32, "
               "float16, bfloat16 (default: float32)\n";
  std::cout << "  --permute-tiles         Store codes in 16x32 MMA tile layout\n";
  std::cout << "  --verify                Unpack and re-read everything that "
               "is written\n";
  std::cout << "  --log-file <path>       Log file (default: "
               "<output>/ternpack-convert.log)\n";
  std::cout << "  --verbose, -v           Verbose output\n";
  std::cout << "  --help, -h              Show this help\n";
}

struct ConvertArgs {
  ConvertOptions options;
  std::string log_file;
  bool verbose = false;
  bool help = false;
};

bool parse_args(int argc, char **argv, ConvertArgs &args, std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto next = [&](std::string &out) {
      if (i + 1 >= argc) {
        error = "missing value for " + arg;
        return false;
      }
      out = argv[++i];
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      return true;
    } else if (arg == "--input" || arg == "-i") {
      if (!next(args.options.input_dir))
        return false;
    } else if (arg == "--output" || arg == "-o") {
      if (!next(args.options.output_dir))
        return false;
    } else if (arg == "--source-dtype") {
      if (!next(args.options.source_dtype))
        return false;
    } else if (arg == "--log-file") {
      if (!next(args.log_file))
        return false;
    } else if (arg == "--permute-tiles") {
      args.options.permute_tiles = true;
    } else if (arg == "--verify") {
      args.options.verify = true;
    } else if (arg == "--verbose" || arg == "-v") {
      args.verbose = true;
    } else {
      error = "unknown option " + arg;
      return false;
    }
  }
  return true;
}

int main(int argc, char **argv) {
  ConvertArgs args;
  std::string error;

  if (!parse_args(argc, argv, args, error)) {
    std::cerr << "Error: " << error << "\n\n";
    print_usage(argv[0]);
    return 1;
  }
  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.options.output_dir.empty())
    args.options.output_dir = default_output_dir(args.options.input_dir);
  if (args.log_file.empty())
    args.log_file = args.options.output_dir + "/ternpack-convert.log";

  // The log file lives in the output directory
  std::error_code ec;
  std::filesystem::path log_parent =
      std::filesystem::path(args.log_file).parent_path();
  if (!log_parent.empty())
    std::filesystem::create_directories(log_parent, ec);

  LogConfig log_config;
  log_config.log_level = args.verbose ? LogLevel::DEBUG : LogLevel::INFO;
  log_config.log_file_path = args.log_file;
  if (!configure_logging(log_config, error)) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  log_info("Input:  " + args.options.input_dir);
  log_info("Output: " + args.options.output_dir);
  log_info("Source: " + args.options.source_dtype + "\n");

  ConvertSummary summary;
  if (!convert_model(args.options, summary, error)) {
    log_error(error);
    shutdown_logging();
    return 1;
  }

  size_t plain_bytes = summary.plain_params * sizeof(float);
  size_t source_bytes =
      (summary.quantized_params + summary.plain_params) * sizeof(float);
  size_t output_bytes = summary.packed_bytes + plain_bytes;

  log_info("\nConversion Statistics:");
  log_info("  Source tensors:    " + std::to_string(summary.num_source_tensors));
  log_info("  Blocks written:    " + std::to_string(summary.num_blocks));
  log_info("  Ternary params:    " +
           std::to_string(summary.quantized_params / 1000000.0) + "M");
  log_info("  FP32 params:       " +
           std::to_string(summary.plain_params / 1000000.0) + "M");
  log_info("  Output size:       " +
           std::to_string(output_bytes / 1024.0 / 1024.0) + " MB");
  if (output_bytes > 0) {
    log_info("  Compression ratio: " +
             std::to_string(static_cast<double>(source_bytes) / output_bytes) +
             "x vs FP32");
  }

  log_info("\nConversion complete in " +
           std::to_string(summary.elapsed_seconds) + "s");
  shutdown_logging();
  return 0;
}
