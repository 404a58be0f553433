#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <lockbox/automation/expiry_poller.hpp>
#include <lockbox/config/deployment.hpp>
#include <lockbox/execution/engine.hpp>
#include <lockbox/rpc/server.hpp>
#include <lockbox/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) { shutdown_requested() = true; }

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("lockbox.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "lockbox", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto grpc_port = std::string{};
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto network = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Lockbox"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-port,g",
      boost::program_options::value<std::string>(&grpc_port)
          ->default_value("0.0.0.0:26658"),
      "IP:Port for the gRPC server")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "lockbox.db"),
      "RocksDB directory")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "INI file with one section per network")(
      "network,n",
      boost::program_options::value<std::string>(&network)->default_value(
          "local"),
      "Network section to deploy with")(
      "disable-poller", "Do not run the built-in expiry poller")(
      "verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    spdlog::error("Invalid command line: {}", e.what());
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto error = std::string{};
  auto deployment =
      lockbox::config::load_deployment_file(config_path, network, error);
  if (!deployment) {
    spdlog::error("Failed to load deployment: {}", error);
    spdlog::shutdown();
    return 1;
  }

  auto encoder = lockbox::schema::encoding::encoder<
      lockbox::schema::encoding::scale_encoder_tag>{};
  auto storage =
      lockbox::storage::make_storage<lockbox::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = lockbox::execution::engine{encoder, storage};

  auto poller = std::optional<lockbox::automation::expiry_poller>{};
  if (!vm.contains("disable-poller")) {
    poller.emplace(engine, deployment.value());
    poller->start();
  }

  spdlog::info("gRPC service listening on {}", grpc_port);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = lockbox::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_port, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC server on {}", grpc_port);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    grpc_server->GetHealthCheckService()->SetServingStatus(true);
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  if (poller) {
    poller->stop();
  }
  spdlog::shutdown();
  return 0;
}
