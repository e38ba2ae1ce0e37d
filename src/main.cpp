#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <oracle/abci/server.hpp>
#include <oracle/blake3/hash.hpp>
#include <oracle/crypto/verify.hpp>
#include <oracle/program/uid_policy.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
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
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_port = std::string{};
  auto db_path = std::string{};
  auto program_id_hex = std::string{};
  auto uid_policy_name = std::string{};
  auto log_file = std::string{};
  auto config_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"BRC-20 Oracle"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_file),
      "INI style configuration file")(
      "grpc-port,g",
      boost::program_options::value<std::string>(&grpc_port)
          ->default_value("0.0.0.0:26658"),
      "IP:Port for the ABCI server")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "oracle-db"),
      "RocksDB directory")(
      "program-id,p",
      boost::program_options::value<std::string>(&program_id_hex),
      "Hex encoded 32-byte oracle program id (default blake3(\"brc20-oracle\"))")(
      "uid-policy",
      boost::program_options::value<std::string>(&uid_policy_name)
          ->default_value("assign_and_increment"),
      "Asset uid assignment: none, assign, assign_and_increment")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "oracle.log"),
      "Log file path")("verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto input = std::ifstream{vm["config"].as<std::string>()};
      if (!input.good()) {
        std::cerr << "Unable to open config file "
                  << vm["config"].as<std::string>() << std::endl;
        return 1;
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(input, description), vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "oracle", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  if (!oracle::crypto::available()) {
    spdlog::critical("OpenSSL does not provide ed25519");
    spdlog::shutdown();
    return 1;
  }

  auto program_id = oracle::blake3::hash(std::string_view{"brc20-oracle"});
  if (!program_id_hex.empty()) {
    auto parsed = oracle::schema::try_make_hash32(program_id_hex);
    if (!parsed) {
      spdlog::critical("--program-id must be 64 hex characters");
      spdlog::shutdown();
      return 1;
    }
    program_id = *parsed;
  }

  auto policy =
      oracle::schema::try_from_string<oracle::program::uid_policy>(
          uid_policy_name);
  if (!policy) {
    spdlog::critical("Unknown --uid-policy '{}'", uid_policy_name);
    spdlog::shutdown();
    return 1;
  }

  auto encoder = oracle::schema::encoding::encoder<
      oracle::schema::encoding::scale_encoder_tag>{};
  auto storage =
      oracle::storage::make_storage<oracle::storage::rocksdb_storage_tag>(
          db_path);
  auto engine =
      oracle::execution::engine{encoder, storage, program_id, *policy};

  spdlog::info("gRPC service listening on {}", grpc_port);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = oracle::abci::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_port, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_port);
    spdlog::shutdown();
    return 1;
  }
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

  spdlog::shutdown();
  return 0;
}
