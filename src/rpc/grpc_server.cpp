#include "rpc/grpc_server.hpp"

#include <grpcpp/health_check_service_interface.h>

#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <pthread.h>

#include "core/log.hpp"
#include "stream/session_limiter.hpp"

namespace edge_rpc {

// Blocks SIGINT/SIGTERM in the calling thread (and every thread it starts
// afterwards, including gRPC's pollers) so a dedicated thread can sigwait.
static sigset_t block_shutdown_signals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  return set;
}

int run_grpc_server(const canny_edge_server::ServerConfig &config,
                    TransformFactory transform_factory) {
  const sigset_t shutdown_signals = block_shutdown_signals();

  edge_stream::SessionLimiter limiter(config.server.max_concurrent_sessions);

  ServiceOptions options;
  options.chunk_size = config.stream.chunk_size;
  options.admission_timeout =
      std::chrono::milliseconds(config.server.admission_timeout_ms);
  DetectEdgesService service(limiter, std::move(transform_factory), options);

  grpc::EnableDefaultHealthCheckService(config.server.enable_health_service);

  grpc::ServerBuilder builder;
  int bound_port = 0;
  builder.AddListeningPort(config.server.listen_address,
                           grpc::InsecureServerCredentials(), &bound_port);
  builder.SetMaxReceiveMessageSize(
      static_cast<int>(config.server.max_message_bytes));
  builder.SetMaxSendMessageSize(
      static_cast<int>(config.server.max_message_bytes));
  builder.RegisterService(&service);

  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || bound_port == 0) {
    throw std::runtime_error("failed to start gRPC server on " +
                             config.server.listen_address);
  }

  edge_log::log_err("listening on " + config.server.listen_address +
                    " (max " +
                    std::to_string(config.server.max_concurrent_sessions) +
                    " concurrent sessions, chunk_size=" +
                    std::to_string(config.stream.chunk_size) + ")");

  std::thread signal_waiter([&server, shutdown_signals]() {
    int sig = 0;
    sigwait(&shutdown_signals, &sig);
    edge_log::log_err("received signal " + std::to_string(sig) +
                      "; shutting down");
    server->Shutdown(std::chrono::system_clock::now() +
                     std::chrono::seconds(5));
  });

  server->Wait();
  signal_waiter.join();

  edge_log::log_err("server stopped");
  return 0;
}

} // namespace edge_rpc
