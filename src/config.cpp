#include "config.hpp"
#include <filesystem>
#include <limits>
#include <stdexcept>

namespace canny_edge_server {

namespace fs = std::filesystem;

TransportMode parse_transport_mode(const std::string &mode_str) {
  if (mode_str == "grpc") {
    return TransportMode::Grpc;
  } else if (mode_str == "stdio") {
    return TransportMode::Stdio;
  } else {
    throw std::runtime_error("Invalid server.transport: '" + mode_str +
                             "'. Valid values: grpc, stdio");
  }
}

const char *to_string(TransportMode mode) {
  switch (mode) {
  case TransportMode::Grpc:
    return "grpc";
  case TransportMode::Stdio:
    return "stdio";
  }
  return "unknown";
}

// Reads an integer field that must be >= min_value
static int64_t read_int(const YAML::Node &node, const std::string &name,
                        int64_t min_value) {
  int64_t value = 0;
  try {
    value = node.as<int64_t>();
  } catch (const YAML::Exception &) {
    throw std::runtime_error("[CONFIG] " + name + " must be an integer");
  }
  if (value < min_value) {
    throw std::runtime_error("[CONFIG] " + name + " must be >= " +
                             std::to_string(min_value));
  }
  return value;
}

static void parse_server_section(const YAML::Node &node,
                                 ServerSettings &server) {
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] 'server' section must be a map");
  }

  for (const auto &kv : node) {
    const std::string key = kv.first.as<std::string>();
    if (key == "listen_address") {
      server.listen_address = kv.second.as<std::string>();
    } else if (key == "transport") {
      try {
        server.transport = parse_transport_mode(kv.second.as<std::string>());
      } catch (const std::runtime_error &e) {
        throw std::runtime_error(std::string("[CONFIG] ") + e.what());
      }
    } else if (key == "max_concurrent_sessions") {
      server.max_concurrent_sessions = static_cast<size_t>(
          read_int(kv.second, "server.max_concurrent_sessions", 1));
    } else if (key == "admission_timeout_ms") {
      server.admission_timeout_ms =
          read_int(kv.second, "server.admission_timeout_ms", 0);
    } else if (key == "max_message_bytes") {
      server.max_message_bytes = static_cast<size_t>(
          read_int(kv.second, "server.max_message_bytes", 1));
    } else if (key == "enable_health_service") {
      try {
        server.enable_health_service = kv.second.as<bool>();
      } catch (const YAML::Exception &) {
        throw std::runtime_error(
            "[CONFIG] server.enable_health_service must be a boolean");
      }
    } else {
      throw std::runtime_error("[CONFIG] Unknown key 'server." + key + "'");
    }
  }
}

static void parse_stream_section(const YAML::Node &node,
                                 StreamSettings &stream) {
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] 'stream' section must be a map");
  }

  for (const auto &kv : node) {
    const std::string key = kv.first.as<std::string>();
    if (key == "chunk_size") {
      stream.chunk_size =
          static_cast<size_t>(read_int(kv.second, "stream.chunk_size", 1));
    } else {
      throw std::runtime_error("[CONFIG] Unknown key 'stream." + key + "'");
    }
  }
}

void validate_config(const ServerConfig &config) {
  if (config.server.listen_address.empty()) {
    throw std::runtime_error("[CONFIG] server.listen_address must not be empty");
  }
  if (config.server.max_concurrent_sessions == 0) {
    throw std::runtime_error("[CONFIG] server.max_concurrent_sessions must be >= 1");
  }
  if (config.stream.chunk_size == 0 || config.stream.chunk_size > kMaxChunkSize) {
    throw std::runtime_error("[CONFIG] stream.chunk_size must be in range [1, " +
                             std::to_string(kMaxChunkSize) + "]");
  }
  // Room for the chunk plus protobuf framing overhead
  if (config.server.max_message_bytes < config.stream.chunk_size + 64) {
    throw std::runtime_error(
        "[CONFIG] server.max_message_bytes must be >= stream.chunk_size + 64");
  }
  // gRPC takes message limits as int
  if (config.server.max_message_bytes >
      static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("[CONFIG] server.max_message_bytes must be <= " +
                             std::to_string(std::numeric_limits<int>::max()));
  }
}

ServerConfig parse_config(const YAML::Node &yaml) {
  ServerConfig config;

  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("[CONFIG] Top level must be a map");
  }

  try {
    for (const auto &kv : yaml) {
      const std::string section = kv.first.as<std::string>();
      if (section == "server") {
        parse_server_section(kv.second, config.server);
      } else if (section == "stream") {
        parse_stream_section(kv.second, config.stream);
      } else {
        throw std::runtime_error("[CONFIG] Unknown section '" + section + "'");
      }
    }
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(std::string("[CONFIG] ") + e.what());
  }

  validate_config(config);
  return config;
}

ServerConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  ServerConfig config = parse_config(yaml);
  config.config_file_path = fs::absolute(path).string();
  return config;
}

} // namespace canny_edge_server
