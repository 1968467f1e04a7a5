#pragma once

#include <adjuster/schema/claim_status.hpp>
#include <adjuster/schema/primitives.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace adjuster::cli {

/// Fully validated command line of the `adjuster` tool.
struct cli_options final {
  std::string command;
  std::string db_path{"adjuster.db"};
  std::optional<adjuster::schema::account_id_t> caller;
  std::optional<adjuster::schema::account_id_t> deployer;
  std::optional<std::string> customer_id;
  std::optional<adjuster::schema::amount_t> amount;
  std::optional<adjuster::schema::claim_id_t> claim_id;
  std::optional<adjuster::schema::claim_status_t> status;
  std::optional<adjuster::schema::account_id_t> new_owner;
  adjuster::schema::event_id_t from_id{1};
  adjuster::schema::event_id_t to_id{
      std::numeric_limits<adjuster::schema::event_id_t>::max()};
  bool verbose{};
};

struct parse_result final {
  std::optional<cli_options> options;
  bool help_requested{};
  std::string error;
  std::string usage;
};

/// Parse argv (and the optional --config file; command line values win).
/// Required options are checked per command so that a returned
/// `cli_options` is ready to execute.
parse_result parse_options(int argc, const char* const argv[]);

/// The identity that owns a freshly created store: --deployer, else
/// --caller.
std::optional<adjuster::schema::account_id_t> resolve_deployer(
    const cli_options& options);

}  // namespace adjuster::cli
