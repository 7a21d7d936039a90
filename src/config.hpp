#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace canny_edge_server {

// How sessions reach the server
enum class TransportMode {
  Grpc, // CannyEdgeDetector.DetectEdges over HTTP/2
  Stdio // One session over stdin/stdout (uint32_le framed protobuf)
};

// Server section
struct ServerSettings {
  std::string listen_address = "0.0.0.0:50051";
  TransportMode transport = TransportMode::Grpc;
  size_t max_concurrent_sessions = 10;
  int64_t admission_timeout_ms = 30000; // 0 = reject immediately when full
  size_t max_message_bytes = 4u * 1024u * 1024u;
  bool enable_health_service = true;
};

// Stream section
struct StreamSettings {
  size_t chunk_size = 2048; // outbound OutputChunk size limit
};

// Complete server configuration
struct ServerConfig {
  std::optional<std::string> config_file_path; // unset when running on defaults
  ServerSettings server;
  StreamSettings stream;
};

constexpr size_t kMaxChunkSize = 1024u * 1024u;

// Load server configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
ServerConfig load_config(const std::string &path);

// Parse configuration from an already loaded YAML document
// Throws std::runtime_error if validation fails
ServerConfig parse_config(const YAML::Node &yaml);

// Check cross-field constraints (also used after command line overrides)
// Throws std::runtime_error on violation
void validate_config(const ServerConfig &config);

// Parse transport mode from string
// Throws std::runtime_error if mode is invalid
TransportMode parse_transport_mode(const std::string &mode_str);

const char *to_string(TransportMode mode);

} // namespace canny_edge_server
