#include <spdlog/spdlog.h>
#include <adjuster/cli/commands.hpp>
#include <adjuster/registry/claim_text.hpp>
#include <nlohmann/json.hpp>

using namespace adjuster::schema;

namespace {

template <typename T>
int report_failure(const operation_result<T>& result, std::ostream& err) {
  auto code = result.error();
  err << (code ? to_string(*code) : std::string_view{"Unknown"}) << ": "
      << result.log << '\n';
  return adjuster::cli::kExitRegistryFailure;
}

void log_events(const std::vector<claim_event_t>& events) {
  for (const auto& event : events) {
    auto record = claim_event_record_t{.event = event};
    spdlog::debug("event {}", adjuster::registry::to_json(record).dump());
  }
}

std::string describe(const std::optional<account_id_t>& account) {
  if (!account) {
    return "none";
  }
  return to_prefixed_hex(bytes_view_t{*account});
}

}  // namespace

namespace adjuster::cli {

int run_command(const cli_options& options,
                adjuster::registry::claim_registry& registry,
                std::ostream& out,
                std::ostream& err) {
  const auto& command = options.command;

  if (command == "submit") {
    auto result =
        registry.submit_claim(*options.caller, *options.customer_id, *options.amount);
    if (!result.ok()) {
      return report_failure(result, err);
    }
    log_events(result.events);
    out << *result.value << '\n';
    return kExitSuccess;
  }

  if (command == "update-status") {
    auto result = registry.update_claim_status(*options.caller,
                                               *options.claim_id, *options.status);
    if (!result.ok()) {
      return report_failure(result, err);
    }
    log_events(result.events);
    out << to_string(*options.status) << '\n';
    return kExitSuccess;
  }

  if (command == "get") {
    auto result = registry.get_claim(*options.claim_id);
    if (!result.ok()) {
      return report_failure(result, err);
    }
    const auto& claim = *result.value;
    out << to_prefixed_hex(bytes_view_t{claim.customer_id_hash}) << ' '
        << to_string(claim.amount) << ' ' << claim.claim_date << ' '
        << to_string(claim.status) << '\n';
    return kExitSuccess;
  }

  if (command == "verify") {
    auto result =
        registry.verify_claim_ownership(*options.claim_id, *options.customer_id);
    if (!result.ok()) {
      return report_failure(result, err);
    }
    out << (*result.value ? "true" : "false") << '\n';
    return kExitSuccess;
  }

  if (command == "serialize") {
    auto result = registry.serialize_claim(*options.claim_id);
    if (!result.ok()) {
      return report_failure(result, err);
    }
    out << *result.value << '\n';
    return kExitSuccess;
  }

  if (command == "list") {
    out << registry.list_customer_claims_as_text(*options.customer_id) << '\n';
    return kExitSuccess;
  }

  if (command == "transfer-ownership") {
    auto result = registry.transfer_ownership(*options.caller, *options.new_owner);
    if (!result.ok()) {
      return report_failure(result, err);
    }
    log_events(result.events);
    out << describe(options.new_owner) << '\n';
    return kExitSuccess;
  }

  if (command == "renounce-ownership") {
    auto result = registry.renounce_ownership(*options.caller);
    if (!result.ok()) {
      return report_failure(result, err);
    }
    log_events(result.events);
    out << "none\n";
    return kExitSuccess;
  }

  if (command == "info") {
    auto info = registry.info();
    auto object = nlohmann::ordered_json::object();
    object["data"] = info.data;
    object["version"] = info.version;
    object["owner"] = describe(info.owner);
    object["nextClaimId"] = std::to_string(info.next_claim_id);
    object["totalClaims"] = std::to_string(info.total_claims);
    object["nextEventId"] = std::to_string(info.next_event_id);
    out << object.dump() << '\n';
    return kExitSuccess;
  }

  if (command == "events") {
    auto array = nlohmann::ordered_json::array();
    for (const auto& record : registry.events(options.from_id, options.to_id)) {
      array.push_back(adjuster::registry::to_json(record));
    }
    out << array.dump() << '\n';
    return kExitSuccess;
  }

  err << "unknown command '" << command << "'\n";
  return kExitUsage;
}

}  // namespace adjuster::cli
