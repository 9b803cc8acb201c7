#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <dca/common/critical.hpp>
#include <dca/execution/purchase_authorizer.hpp>
#include <dca/execution/schedule_store.hpp>
#include <dca/fees/fee_calculator.hpp>
#include <dca/storage/rocksdb/storage.hpp>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {

dca::schema::address_t get_address(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    dca::common::critical("missing required address argument --" + name);
  }
  auto address = dca::schema::try_make_address(vm[name].as<std::string>());
  if (!address) {
    dca::common::critical("--" + name + " must be a 20-byte hex address");
  }
  return *address;
}

dca::schema::amount_t get_amount(const po::variables_map& vm,
                                 const std::string& name) {
  auto amount = dca::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    dca::common::critical("--" + name + " must be a base-10 amount");
  }
  return *amount;
}

dca::storage::storage<dca::storage::rocksdb_storage_tag> open_storage(
    const po::variables_map& vm) {
  if (!vm.contains("db")) {
    dca::common::critical("this command requires --db");
  }
  return dca::storage::make_storage<dca::storage::rocksdb_storage_tag>(
      vm["db"].as<std::string>());
}

void print_schedules(const dca::execution::schedule_store& store,
                     const po::variables_map& vm) {
  auto owner = get_address(vm, "owner");
  auto token = get_address(vm, "token");
  auto now = vm["now"].as<uint64_t>();
  const auto& schedules = store.schedules(owner, token);
  for (std::size_t i = 0; i < schedules.size(); ++i) {
    const auto& schedule = schedules[i];
    auto eligibility =
        dca::execution::purchase_authorizer::classify(schedule, now);
    std::cout << i << ' ' << dca::schema::to_hex(schedule.schedule_id)
              << " balance=" << schedule.token_balance
              << " purchase_amount=" << schedule.purchase_amount
              << " period=" << schedule.purchase_period
              << " last_purchase=" << schedule.last_purchase_timestamp
              << " lending_protocol=" << schedule.lending_protocol_index
              << " status=" << dca::schema::to_string(eligibility.status)
              << (eligibility.depleted ? " depleted" : "") << '\n';
  }
}

void print_events(const dca::execution::schedule_store& store,
                  const po::variables_map& vm) {
  auto from = vm["from"].as<uint64_t>();
  auto to = vm.contains("to") ? vm["to"].as<uint64_t>() : store.event_count();
  auto sequence = from;
  for (const auto& event : store.events(from, to)) {
    std::cout << sequence++ << ' ' << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
}

void print_settings(const dca::execution::schedule_store& store) {
  const auto& settings = store.settings();
  std::cout << "min_purchase_period=" << settings.min_purchase_period << '\n'
            << "max_schedules_per_token=" << settings.max_schedules_per_token
            << '\n'
            << "default_min_purchase_amount="
            << settings.default_min_purchase_amount << '\n';
  for (const auto& [token, amount] : settings.token_min_purchase_amounts) {
    std::cout << "min_purchase_amount[" << dca::schema::to_hex(token)
              << "]=" << amount << '\n';
  }
}

void print_fee(const po::variables_map& vm) {
  auto settings = dca::schema::fee_settings_t{};
  settings.min_fee_rate = vm["min-fee-rate"].as<uint64_t>();
  settings.max_fee_rate = vm["max-fee-rate"].as<uint64_t>();
  if (vm.contains("lower-bound")) {
    settings.purchase_lower_bound = get_amount(vm, "lower-bound");
  }
  if (vm.contains("upper-bound")) {
    settings.purchase_upper_bound = get_amount(vm, "upper-bound");
  }
  if (!vm.contains("amount")) {
    dca::common::critical("fee command requires --amount");
  }
  auto calculator =
      dca::fees::fee_calculator{dca::schema::make_zero_address(), settings};
  auto amount = get_amount(vm, "amount");
  auto fee = calculator.calculate_fee(amount);
  std::cout << "fee=" << fee << " net=" << (amount - fee) << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  dca_inspect schedules --db PATH --owner HEX --token HEX\n"
            << "  dca_inspect users --db PATH\n"
            << "  dca_inspect events --db PATH [--from N] [--to N]\n"
            << "  dca_inspect settings --db PATH\n"
            << "  dca_inspect fee --amount N [fee options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_default_logger(spdlog::stdout_color_mt("dca_inspect"));

  auto command = std::string{};
  auto options = po::options_description{"dca_inspect options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "schedules|users|events|settings|fee")(
      "db", po::value<std::string>(), "RocksDB directory of the store")(
      "owner", po::value<std::string>(), "schedule owner address hex")(
      "token", po::value<std::string>(), "token address hex")(
      "now", po::value<uint64_t>()->default_value(0),
      "timestamp used to classify schedules")(
      "from", po::value<uint64_t>()->default_value(0), "first event sequence")(
      "to", po::value<uint64_t>(), "event sequence to stop before")(
      "amount", po::value<std::string>(), "purchase amount")(
      "min-fee-rate", po::value<uint64_t>()->default_value(100),
      "fee rate at or above the upper bound")(
      "max-fee-rate", po::value<uint64_t>()->default_value(200),
      "fee rate at or below the lower bound")(
      "lower-bound", po::value<std::string>(), "purchase lower bound")(
      "upper-bound", po::value<std::string>(), "purchase upper bound")(
      "verbose,v", "enable debug logging");

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
    print_help(options);
    return 0;
  }
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  if (command == "fee") {
    print_fee(vm);
    return 0;
  }

  auto storage = open_storage(vm);
  auto encoder = dca::execution::encoder_t{};
  auto store = dca::execution::schedule_store{encoder, storage};
  store.load();

  if (command == "schedules") {
    print_schedules(store, vm);
    return 0;
  }
  if (command == "users") {
    for (const auto& user : store.users()) {
      std::cout << dca::schema::to_hex(user) << '\n';
    }
    return 0;
  }
  if (command == "events") {
    print_events(store, vm);
    return 0;
  }
  if (command == "settings") {
    print_settings(store);
    return 0;
  }

  dca::common::critical(
      "command must be schedules|users|events|settings|fee");
}
