#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

#include "config.hpp"
#include "core/log.hpp"
#include "rpc/stdio_session.hpp"
#include "transform/canny_edge_transform.hpp"

#ifdef HAVE_GRPC
#include "rpc/grpc_server.hpp"
#endif

using edge_log::log_err;

static void set_binary_mode_stdio() {
#ifdef _WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif
}

static void print_usage() {
  log_err("Usage: canny-edge-server [--config <path/to/server.yaml>] "
          "[--listen <host:port>] [--transport grpc|stdio]");
}

static std::unique_ptr<edge_transform::ImageTransform> make_transform() {
  return std::make_unique<edge_transform::CannyEdgeTransform>();
}

static int run_stdio(const canny_edge_server::ServerConfig &config) {
  set_binary_mode_stdio();
  log_err("starting (transport=stdio+uint32_le, chunk_size=" +
          std::to_string(config.stream.chunk_size) + ")");

  auto transform = make_transform();
  const auto outcome = edge_wire::run_framed_session(
      std::cin, std::cout, *transform, config.stream.chunk_size);

  if (outcome.ok()) {
    log_err("session done (in=" + std::to_string(outcome.payload_bytes) +
            " bytes, out=" + std::to_string(outcome.chunks_sent) +
            " chunks); exiting cleanly");
    return 0;
  }
  log_err(std::string("session failed [") + to_string(outcome.error) +
          "]: " + outcome.message);
  return 2;
}

int main(int argc, char **argv) {
  edge_log::set_program_name("canny-edge-server");

  std::optional<std::string> config_path;
  std::optional<std::string> listen_address;
  std::optional<std::string> transport_name;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--listen" && i + 1 < argc) {
      listen_address = argv[++i];
    } else if (arg == "--transport" && i + 1 < argc) {
      transport_name = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      log_err("unknown argument: " + arg);
      print_usage();
      return 1;
    }
  }

  canny_edge_server::ServerConfig config;
  try {
    if (config_path) {
      log_err("loading configuration from: " + *config_path);
      config = canny_edge_server::load_config(*config_path);
    }
    if (listen_address) {
      config.server.listen_address = *listen_address;
    }
    if (transport_name) {
      config.server.transport =
          canny_edge_server::parse_transport_mode(*transport_name);
    }
    canny_edge_server::validate_config(config);
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to load configuration: " + std::string(e.what()));
    return 1;
  }

  switch (config.server.transport) {
  case canny_edge_server::TransportMode::Stdio:
    return run_stdio(config);

  case canny_edge_server::TransportMode::Grpc:
#ifdef HAVE_GRPC
    try {
      return edge_rpc::run_grpc_server(config, make_transform);
    } catch (const std::exception &e) {
      log_err("FATAL: " + std::string(e.what()));
      return 1;
    }
#else
    log_err("FATAL: transport=grpc requires gRPC support. Rebuild with "
            "-DENABLE_GRPC=ON (needs grpc_cpp_plugin)");
    return 1;
#endif
  }

  log_err("FATAL: unknown transport mode");
  return 1;
}
