#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <converge/common/context.hpp>
#include <converge/common/critical.hpp>
#include <converge/common/logging.hpp>
#include <converge/reconcile/lifecycle.hpp>
#include <converge/reconcile/reconciler.hpp>
#include <converge/reconcile/state_accessor.hpp>
#include <converge/remote/grpc_client.hpp>
#include <converge/schema/attributes.hpp>
#include <converge/schema/resource_state.hpp>
#include <converge/storage/rocksdb/storage.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace {

namespace po = boost::program_options;
using storage_t =
    converge::storage::storage<converge::storage::rocksdb_storage_tag>;

constexpr auto kDeclaredOptions = std::array{
    std::pair<std::string_view, std::string_view>{"name", "name"},
    std::pair<std::string_view, std::string_view>{"description",
                                                  "description"},
    std::pair<std::string_view, std::string_view>{"default-action",
                                                  "default_action"},
    std::pair<std::string_view, std::string_view>{
        "default-action-base-intrusion-policy-id",
        "default_action_base_intrusion_policy_id"},
    std::pair<std::string_view, std::string_view>{
        "default-action-syslog-config-id", "default_action_syslog_config_id"},
    std::pair<std::string_view, std::string_view>{
        "default-action-send-events-to-fmc",
        "default_action_send_events_to_fmc"},
    std::pair<std::string_view, std::string_view>{"default-action-log-begin",
                                                  "default_action_log_begin"},
    std::pair<std::string_view, std::string_view>{"default-action-log-end",
                                                  "default_action_log_end"},
};

converge::schema::attribute_map_t collect_attributes(const po::variables_map& vm) {
  auto attributes = converge::schema::attribute_map_t{};
  for (const auto& [option, attribute] : kDeclaredOptions) {
    auto key = std::string{option};
    if (vm.contains(key)) {
      attributes.emplace(std::string{attribute}, vm[key].as<std::string>());
    }
  }
  return attributes;
}

int report(const converge::schema::diagnostics_t& diagnostics) {
  for (const auto& d : diagnostics) {
    std::cerr << converge::schema::to_string(d.severity) << ": " << d.summary
              << ": " << d.detail << '\n';
  }
  return converge::schema::has_error(diagnostics) ? 1 : 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  converge apply [options]\n"
            << "  converge refresh [options]\n"
            << "  converge destroy [options]\n"
            << "  converge show [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"converge options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "apply|refresh|destroy|show")(
      "state-path", po::value<std::string>()->default_value("converge-state"),
      "RocksDB directory holding resource state")(
      "remote", po::value<std::string>()->default_value("127.0.0.1:26659"),
      "access policy service host:port")(
      "address",
      po::value<std::string>()->default_value("converge_access_policy.default"),
      "resource address used as the state key")(
      "deadline-ms", po::value<uint64_t>()->default_value(30000),
      "deadline per lifecycle call in milliseconds, 0 for none, at most 24h")(
      "on-not-found", po::value<std::string>()->default_value("fail"),
      "fail|forget when a tracked policy is gone remotely")(
      "log-file", po::value<std::string>(), "also write logs to this file")(
      "verbose,v", "enable verbose output")("name", po::value<std::string>(),
                                            "access policy name")(
      "description", po::value<std::string>(), "access policy description")(
      "default-action", po::value<std::string>(),
      "BLOCK|TRUST|PERMIT|NETWORK_DISCOVERY|INHERIT_FROM_PARENT")(
      "default-action-base-intrusion-policy-id", po::value<std::string>(),
      "intrusion policy identity")("default-action-syslog-config-id",
                                   po::value<std::string>(),
                                   "syslog alert identity")(
      "default-action-send-events-to-fmc", po::value<std::string>(),
      "true|false")("default-action-log-begin", po::value<std::string>(),
                    "true|false")("default-action-log-end",
                                  po::value<std::string>(), "true|false");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto logging = converge::common::logging_options{
      .logger_name = "converge", .verbose = vm.contains("verbose")};
  if (vm.contains("log-file")) {
    logging.log_file = vm["log-file"].as<std::string>();
  }
  converge::common::configure_logging(logging);

  auto policy = converge::reconcile::try_parse_not_found_policy(
      vm["on-not-found"].as<std::string>());
  if (!policy.has_value()) {
    converge::common::critical("--on-not-found must be fail|forget");
  }

  const auto address = vm["address"].as<std::string>();
  auto storage = converge::storage::make_storage<
      converge::storage::rocksdb_storage_tag>(
      vm["state-path"].as<std::string>());

  if (command == "show") {
    auto state = storage.load_resource_state(address);
    if (!state.has_value()) {
      std::cerr << "no state stored for " << address << '\n';
      return 1;
    }
    for (const auto& [key, value] : converge::schema::render_attributes(*state)) {
      std::cout << key << " = \"" << value << "\"\n";
    }
    return 0;
  }

  auto client =
      converge::remote::grpc_client::connect(vm["remote"].as<std::string>());
  auto reconciler = converge::reconcile::reconciler{
      *client, converge::reconcile::reconcile_options{.not_found_policy =
                                                           *policy}};
  const auto deadline_ms = vm["deadline-ms"].as<uint64_t>();
  if (deadline_ms >
      static_cast<uint64_t>(converge::common::context::kMaxTimeout.count())) {
    converge::common::critical("--deadline-ms must not exceed 86400000");
  }
  const auto context =
      deadline_ms == 0
          ? converge::common::context{}
          : converge::common::context::with_timeout(
                std::chrono::milliseconds{deadline_ms});

  auto exit_code = 0;
  if (command == "apply") {
    auto declaration =
        converge::schema::parse_declaration(collect_attributes(vm));
    if (!declaration) {
      return report(declaration.error());
    }
    auto state = storage.load_resource_state(address).value_or(
        converge::schema::resource_state_t{});
    auto diagnostics = converge::reconcile::apply_declaration(
        reconciler, context, state, declaration.value());
    converge::reconcile::persist(storage, address, state);
    exit_code = report(diagnostics);
  } else if (command == "refresh") {
    auto state = storage.load_resource_state(address);
    if (!state.has_value()) {
      std::cerr << "no state stored for " << address << '\n';
      return 1;
    }
    auto accessor = converge::reconcile::resource_state_accessor{*state};
    auto diagnostics = reconciler.reconcile_read(context, accessor);
    converge::reconcile::persist(storage, address, *state);
    exit_code = report(diagnostics);
  } else if (command == "destroy") {
    auto state = storage.load_resource_state(address);
    if (!state.has_value()) {
      spdlog::info("Nothing to destroy at {}", address);
      return 0;
    }
    auto accessor = converge::reconcile::resource_state_accessor{*state};
    auto diagnostics = reconciler.reconcile_delete(context, accessor);
    converge::reconcile::persist(storage, address, *state);
    exit_code = report(diagnostics);
  } else {
    converge::common::critical("command must be apply|refresh|destroy|show");
  }

  spdlog::shutdown();
  return exit_code;
}
