#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <converge/common/critical.hpp>
#include <converge/common/logging.hpp>
#include <converge/remote/loopback_service.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
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

  auto listen = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"converge-remote"};
  description.add_options()("help,h", "Show the help message")(
      "listen,l",
      boost::program_options::value<std::string>(&listen)->default_value(
          "0.0.0.0:26659"),
      "IP:Port for the access policy service")(
      "log-file", boost::program_options::value<std::string>(&log_file),
      "Also write logs to this file")("verbose,v", "Enable verbose output");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto logging = converge::common::logging_options{
      .logger_name = "converge-remote", .verbose = vm.contains("verbose")};
  if (vm.contains("log-file")) {
    logging.log_file = log_file;
  }
  converge::common::configure_logging(logging);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto service = converge::remote::loopback_service{};
  auto builder = grpc::ServerBuilder();
  builder.AddListeningPort(listen, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  auto server = std::unique_ptr<grpc::Server>(builder.BuildAndStart());
  if (!server) {
    converge::common::critical("Failed to start access policy service");
  }
  spdlog::info("Access policy service listening on {}", listen);
  server->GetHealthCheckService()->SetServingStatus(true);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    spdlog::info("Shutting down with {} access policies held",
                 service.size());
    server->GetHealthCheckService()->SetServingStatus(false);
    server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
