#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tally/common/critical.hpp>
#include <tally/execution/engine.hpp>
#include <tally/ledger/codespace.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace tally::schema;

void configure_logging(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("tally.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "tally", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

account_id_t get_hash32(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    tally::common::critical("missing required identity argument");
  }
  return make_hash32(vm[name].as<std::string>());
}

std::vector<account_id_t> get_accounts(const po::variables_map& vm) {
  auto accounts = std::vector<account_id_t>{};
  if (!vm.contains("account")) {
    return accounts;
  }
  for (const auto& hex : vm["account"].as<std::vector<std::string>>()) {
    accounts.push_back(make_hash32(hex));
  }
  return accounts;
}

amount_t get_amount(const po::variables_map& vm) {
  if (!vm.contains("amount")) {
    tally::common::critical("missing required --amount");
  }
  return vm["amount"].as<amount_t>();
}

int report(const operation_result_t& result) {
  if (succeeded(result)) {
    return 0;
  }
  std::cerr << result.log << " [" << result.codespace << "]";
  if (!result.info.empty()) {
    std::cerr << ": " << result.info;
  }
  std::cerr << '\n';
  return static_cast<int>(result.code);
}

int run(tally::execution::engine& engine,
        const std::string& command,
        const po::variables_map& vm) {
  if (command == "balance") {
    std::cout << engine.get_balance(get_hash32(vm, "account")) << '\n';
    return 0;
  }
  if (command == "supply") {
    std::cout << engine.total_supply() << '\n';
    return 0;
  }
  if (command == "metadata") {
    auto asset = engine.get_metadata();
    if (!asset) {
      return report(make_error_result(ledger_error_code::asset_missing,
                                      "no asset has been initialized",
                                      tally::ledger::kEngineCodespace));
    }
    std::cout << "asset_id:       " << to_hex(asset->asset_id) << '\n'
              << "administrator:  " << to_hex(asset->administrator) << '\n'
              << "symbol:         " << asset->symbol << '\n'
              << "name:           " << asset->name << '\n'
              << "decimals:       " << static_cast<uint32_t>(asset->decimals)
              << '\n'
              << "max_per_holder: " << asset->max_per_holder << '\n';
    return 0;
  }

  auto caller = get_hash32(vm, "caller");

  if (command == "initialize") {
    auto decimals = make_decimals(vm["decimals"].as<uint32_t>());
    if (!decimals) {
      tally::common::critical("--decimals must be between 0 and 255");
    }
    auto options = asset_options_t{
        .symbol = vm["symbol"].as<std::string>(),
        .name = vm["name"].as<std::string>(),
        .decimals = *decimals,
        .max_per_holder = vm["cap"].as<amount_t>()};
    return report(engine.initialize(caller, options));
  }
  if (command == "set-features") {
    return report(engine.set_features(caller, vm["airdrop"].as<bool>(),
                                      vm["whitelist"].as<bool>()));
  }
  if (command == "get-features") {
    auto features = feature_state_t{};
    auto result = engine.get_features(caller, features);
    if (succeeded(result)) {
      std::cout << "airdrop:   " << std::boolalpha << features.airdrop_enabled
                << '\n'
                << "whitelist: " << features.whitelist_enabled << '\n';
    }
    return report(result);
  }
  if (command == "is-whitelisted") {
    auto member = false;
    auto result =
        engine.is_whitelisted(caller, get_hash32(vm, "account"), member);
    if (succeeded(result)) {
      std::cout << std::boolalpha << member << '\n';
    }
    return report(result);
  }
  if (command == "update-whitelist") {
    if (vm.contains("add") == vm.contains("remove")) {
      tally::common::critical("update-whitelist requires --add or --remove");
    }
    return report(
        engine.update_whitelist(caller, get_accounts(vm), vm.contains("add")));
  }
  if (command == "list-whitelist") {
    auto members = std::vector<account_id_t>{};
    auto result = engine.list_whitelist(caller, members);
    for (const auto& member : members) {
      std::cout << to_hex(member) << '\n';
    }
    return report(result);
  }
  if (command == "mint") {
    return report(
        engine.mint(caller, get_hash32(vm, "to"), get_amount(vm)));
  }
  if (command == "transfer") {
    return report(engine.transfer(caller, get_hash32(vm, "from"),
                                  get_hash32(vm, "to"), get_amount(vm)));
  }
  if (command == "burn") {
    return report(
        engine.burn(caller, get_hash32(vm, "from"), get_amount(vm)));
  }
  if (command == "airdrop") {
    auto amounts = vm.contains("amounts")
                       ? vm["amounts"].as<std::vector<amount_t>>()
                       : std::vector<amount_t>{};
    return report(engine.airdrop(caller, get_accounts(vm), amounts));
  }

  tally::common::critical(
      "command must be initialize|set-features|get-features|is-whitelisted|"
      "update-whitelist|list-whitelist|mint|transfer|burn|airdrop|balance|"
      "supply|metadata");
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto db_path = std::string{};

  auto options = po::options_description{"Tally"};
  options.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable verbose output")(
      "db", po::value<std::string>(&db_path)->default_value("./tally-db"),
      "ledger database directory")("command", po::value<std::string>(&command),
                                   "ledger command")(
      "caller", po::value<std::string>(), "calling identity hash32 hex")(
      "account", po::value<std::vector<std::string>>()->multitoken(),
      "holder identity hash32 hex (repeatable)")(
      "amounts",
      po::value<std::vector<tally::schema::amount_t>>()->multitoken(),
      "airdrop amounts, one per --account")(
      "to", po::value<std::string>(), "receiving identity hash32 hex")(
      "from", po::value<std::string>(), "debited identity hash32 hex")(
      "amount", po::value<tally::schema::amount_t>(), "quantity")(
      "airdrop", po::value<bool>()->default_value(false),
      "airdrop gate for set-features")(
      "whitelist", po::value<bool>()->default_value(false),
      "whitelist gate for set-features")("add", "add to the whitelist")(
      "remove", "remove from the whitelist")(
      "symbol", po::value<std::string>()->default_value("TALLY"),
      "asset symbol")("name", po::value<std::string>()->default_value("Tally"),
                      "asset name")(
      "decimals", po::value<uint32_t>()->default_value(0), "asset decimals")(
      "cap",
      po::value<tally::schema::amount_t>()->default_value(
          tally::schema::kDefaultMaxPerHolder),
      "maximum balance per holder");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    std::cout << options << std::endl;
    return 0;
  }

  configure_logging(vm.contains("verbose"));
  spdlog::debug("Opening ledger database at '{}'", db_path);

  auto encoder = tally::scale_encoder_t{};
  auto storage =
      tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(
          db_path);
  auto exit_code = 0;
  {
    auto engine = tally::execution::engine{encoder, storage};
    exit_code = run(engine, command, vm);
  }

  spdlog::shutdown();
  return exit_code;
}
