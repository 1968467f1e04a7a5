#include <adjuster/cli/options.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <sstream>
#include <vector>

namespace po = boost::program_options;
using namespace adjuster::schema;

namespace {

struct command_requirements final {
  std::string_view name;
  std::array<std::string_view, 3> required;
};

inline constexpr auto kCommands = std::array{
    command_requirements{"submit", {"caller", "customer-id", "amount"}},
    command_requirements{"update-status", {"caller", "claim-id", "status"}},
    command_requirements{"get", {"claim-id", "", ""}},
    command_requirements{"verify", {"claim-id", "customer-id", ""}},
    command_requirements{"serialize", {"claim-id", "", ""}},
    command_requirements{"list", {"customer-id", "", ""}},
    command_requirements{"transfer-ownership", {"caller", "new-owner", ""}},
    command_requirements{"renounce-ownership", {"caller", "", ""}},
    command_requirements{"info", {"", "", ""}},
    command_requirements{"events", {"", "", ""}},
};

std::optional<account_id_t> parse_account(const po::variables_map& vm,
                                          const std::string& name,
                                          std::string& error) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  auto value = vm[name].as<std::string>();
  auto account = try_make_hash32(value);
  if (!account) {
    error = "--" + name + " must be 32 bytes of hex (64 digits, optional 0x)";
  }
  return account;
}

std::optional<uint64_t> parse_u64(const std::string& text) {
  auto value = uint64_t{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size() || text.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

namespace adjuster::cli {

parse_result parse_options(const int argc, const char* const argv[]) {
  auto result = parse_result{};

  auto description = po::options_description{"adjuster"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(),
      "INI file with the same long options")(
      "db-path,d",
      po::value<std::string>()->default_value("adjuster.db"),
      "RocksDB directory holding the registry")(
      "caller", po::value<std::string>(), "Identity invoking the command (hex)")(
      "deployer", po::value<std::string>(),
      "Owner of a freshly created registry (hex, defaults to --caller)")(
      "customer-id", po::value<std::string>(), "Raw customer identifier")(
      "amount", po::value<std::string>(), "Claim amount (decimal, uint256)")(
      "claim-id", po::value<std::string>(), "Claim identifier")(
      "status", po::value<std::string>(),
      "Target status: Submitted, Approved or Rejected")(
      "new-owner", po::value<std::string>(), "Identity receiving ownership (hex)")(
      "from", po::value<std::string>(), "First event id (inclusive)")(
      "to", po::value<std::string>(), "Last event id (inclusive)")(
      "verbose,v", "Enable debug logging");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(), "command");
  auto all = po::options_description{};
  all.add(description).add(hidden);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  {
    auto usage = std::ostringstream{};
    usage << "Usage: adjuster <command> [options]\n"
          << "Commands: submit, update-status, get, verify, serialize, list,\n"
          << "          transfer-ownership, renounce-ownership, info, events\n"
          << description;
    result.usage = usage.str();
  }

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        result.error = "cannot open config file '" + path + "'";
        return result;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    result.error = ex.what();
    return result;
  }

  if (vm.contains("help")) {
    result.help_requested = true;
    return result;
  }

  if (!vm.contains("command")) {
    result.error = "missing command";
    return result;
  }

  auto options = cli_options{};
  options.command = vm["command"].as<std::string>();
  options.db_path = vm["db-path"].as<std::string>();
  options.verbose = vm.contains("verbose");

  auto command = std::ranges::find(kCommands, std::string_view{options.command},
                                   &command_requirements::name);
  if (command == std::end(kCommands)) {
    result.error = "unknown command '" + options.command + "'";
    return result;
  }
  for (const auto required : command->required) {
    if (!required.empty() && !vm.contains(std::string{required})) {
      result.error = options.command + " requires --" + std::string{required};
      return result;
    }
  }

  auto error = std::string{};
  options.caller = parse_account(vm, "caller", error);
  if (error.empty()) {
    options.deployer = parse_account(vm, "deployer", error);
  }
  if (error.empty()) {
    options.new_owner = parse_account(vm, "new-owner", error);
  }
  if (!error.empty()) {
    result.error = error;
    return result;
  }

  if (vm.contains("customer-id")) {
    options.customer_id = vm["customer-id"].as<std::string>();
  }
  if (vm.contains("amount")) {
    options.amount = try_parse_amount(vm["amount"].as<std::string>());
    if (!options.amount) {
      result.error = "--amount must be a decimal integer below 2^256";
      return result;
    }
  }
  if (vm.contains("claim-id")) {
    options.claim_id = parse_u64(vm["claim-id"].as<std::string>());
    if (!options.claim_id) {
      result.error = "--claim-id must be an unsigned integer";
      return result;
    }
  }
  if (vm.contains("status")) {
    options.status =
        try_from_string<claim_status_t>(vm["status"].as<std::string>());
    if (!options.status) {
      result.error = "--status must be one of Submitted, Approved, Rejected";
      return result;
    }
  }
  if (vm.contains("from")) {
    auto from_id = parse_u64(vm["from"].as<std::string>());
    if (!from_id) {
      result.error = "--from must be an unsigned integer";
      return result;
    }
    options.from_id = *from_id;
  }
  if (vm.contains("to")) {
    auto to_id = parse_u64(vm["to"].as<std::string>());
    if (!to_id) {
      result.error = "--to must be an unsigned integer";
      return result;
    }
    options.to_id = *to_id;
  }

  result.options = std::move(options);
  return result;
}

std::optional<account_id_t> resolve_deployer(const cli_options& options) {
  if (options.deployer) {
    return options.deployer;
  }
  return options.caller;
}

}  // namespace adjuster::cli
