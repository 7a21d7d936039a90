#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "client/edge_client.hpp"
#include "core/log.hpp"

using edge_log::log_err;

static void print_usage() {
  log_err("Usage: canny-edge-client --input <image> --output <edges.jpg> "
          "[--server <host:port>] [--min N] [--max N] [--chunk-size N] "
          "[--timeout-ms N]");
}

static std::vector<uint8_t> read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open input file: " + path);
  }
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>());
}

static void write_file(const std::string &path,
                       const std::vector<uint8_t> &data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open output file: " + path);
  }
  out.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
  if (!out.good()) {
    throw std::runtime_error("Failed writing output file: " + path);
  }
}

int main(int argc, char **argv) {
  edge_log::set_program_name("canny-edge-client");

  std::string server_address = "localhost:50051";
  std::optional<std::string> input_path;
  std::optional<std::string> output_path;
  edge_client::DetectOptions options;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--server" && i + 1 < argc) {
        server_address = argv[++i];
      } else if (arg == "--input" && i + 1 < argc) {
        input_path = argv[++i];
      } else if (arg == "--output" && i + 1 < argc) {
        output_path = argv[++i];
      } else if (arg == "--min" && i + 1 < argc) {
        options.min_threshold = std::stoi(argv[++i]);
      } else if (arg == "--max" && i + 1 < argc) {
        options.max_threshold = std::stoi(argv[++i]);
      } else if (arg == "--chunk-size" && i + 1 < argc) {
        const long long size = std::stoll(argv[++i]);
        if (size <= 0) {
          throw std::invalid_argument("chunk size must be > 0");
        }
        options.chunk_size = static_cast<size_t>(size);
      } else if (arg == "--timeout-ms" && i + 1 < argc) {
        options.timeout = std::chrono::milliseconds(std::stoll(argv[++i]));
      } else if (arg == "--help" || arg == "-h") {
        print_usage();
        return 0;
      } else {
        log_err("unknown argument: " + arg);
        print_usage();
        return 1;
      }
    }
  } catch (const std::exception &e) {
    log_err("invalid argument value: " + std::string(e.what()));
    return 1;
  }

  if (!input_path || !output_path) {
    log_err("FATAL: --input and --output are required");
    print_usage();
    return 1;
  }

  try {
    const std::vector<uint8_t> image = read_file(*input_path);
    log_err("sending " + std::to_string(image.size()) + " bytes to " +
            server_address);

    edge_client::CannyEdgeClient client(server_address);
    const std::vector<uint8_t> edges = client.detect_edges(image, options);

    write_file(*output_path, edges);
    log_err("received " + std::to_string(edges.size()) + " bytes in " +
            std::to_string(client.last_response_chunks()) + " chunks -> " +
            *output_path);
  } catch (const std::exception &e) {
    log_err("FATAL: " + std::string(e.what()));
    return 2;
  }

  return 0;
}
