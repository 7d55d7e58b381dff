#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <warden/execution/engine.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/node/config.hpp>
#include <warden/node/server.hpp>
#include <warden/protocol/genesis.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
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
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto parsed = warden::node::parse_config(argc, argv);
  if (!parsed.settings) {
    return parsed.exit_code;
  }
  const auto& settings = *parsed.settings;

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      settings.log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "warden", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(settings.verbose ? spdlog::level::debug
                                     : spdlog::level::info);

  auto encoder = warden::execution::engine::encoder_t{};
  auto storage =
      warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(
          settings.db_path);
  auto registry = warden::execution::code_registry{};
  warden::protocol::register_protocol_code(registry);
  auto engine = warden::execution::engine{encoder, storage, settings.chain_id,
                                          std::move(registry)};

  auto addresses =
      warden::protocol::find_protocol(engine, settings.deployer);
  if (!addresses) {
    try {
      addresses = warden::protocol::deploy_protocol(
          engine, settings.deployer, settings.protocol_admin,
          settings.registrar_key);
    } catch (const warden::execution::protocol_error& e) {
      spdlog::critical("Genesis deployment failed: {}", e.what());
      spdlog::shutdown();
      return 1;
    }
  }
  spdlog::info("Router {} gate keeper {}",
               warden::schema::to_hex(addresses->router),
               warden::schema::to_hex(addresses->gate_keeper));

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = warden::node::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(settings.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}",
                     settings.grpc_address);
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("gRPC service listening on {}", settings.grpc_address);
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("Shut down");
  spdlog::shutdown();
  return 0;
}
