#pragma once

#include "config.hpp"
#include "rpc/detect_edges_service.hpp"

namespace edge_rpc {

// Builds and starts the gRPC server, then blocks until SIGINT/SIGTERM.
// Returns the process exit status. Throws std::runtime_error if the server
// cannot be started (e.g. address in use).
int run_grpc_server(const canny_edge_server::ServerConfig &config,
                    TransformFactory transform_factory);

} // namespace edge_rpc
