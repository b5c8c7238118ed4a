#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <registrar/abci/server.hpp>
#include <registrar/config/node_options.hpp>
#include <registrar/execution/engine.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  auto error = std::string{};
  auto options = registrar::config::parse_node_options(argc, argv, error);
  if (!options) {
    std::cerr << "registrar: " << error << std::endl;
    return 1;
  }
  if (options->show_help) {
    std::cout << options->help_text << std::endl;
    return 0;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options->log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "registrar", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options->log_level);

  auto encoder = registrar::execution::engine::encoder_t{};
  auto storage = registrar::storage::make_storage<
      registrar::storage::rocksdb_storage_tag>(options->db_path);
  auto engine = registrar::execution::engine{
      encoder, storage, options->chain_id, options->strict_crypto,
      registrar::registry::registry_options{options->on_revoke}};

  auto replay = engine.replay_history();
  if (!replay.ok) {
    spdlog::error("History replay disagrees with committed state: {}",
                  replay.error);
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("Replayed {} transactions ({} applied) up to height {}",
               replay.tx_count, replay.applied_count, replay.last_height);

  spdlog::info("gRPC service listening on {}", options->grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = registrar::abci::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options->grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Unable to start gRPC server on {}", options->grpc_address);
    spdlog::shutdown();
    return 1;
  }

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    grpc_server->GetHealthCheckService()->SetServingStatus(true);
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
