#include <adjuster/registry/claim_text.hpp>
#include <fmt/format.h>

#include <iterator>
#include <optional>
#include <string>
#include <variant>

using namespace adjuster::schema;

namespace {

std::string hex(const hash32_t& value) {
  return to_prefixed_hex(bytes_view_t{value});
}

nlohmann::ordered_json optional_account(
    const std::optional<account_id_t>& account) {
  if (!account) {
    return nullptr;
  }
  return hex(*account);
}

}  // namespace

namespace adjuster::registry {

// Written with fmt rather than nlohmann: a json value cannot hold a 256-bit
// amount as a number.
std::string to_text(const adjuster::schema::claim_state_t& claim) {
  return fmt::format(
      R"({{"claimId":{},"customerIdHash":"{}","amount":{},"claimDate":{},"status":"{}"}})",
      claim.claim_id, hex(claim.customer_id_hash),
      adjuster::schema::to_string(claim.amount), claim.claim_date,
      adjuster::schema::to_string(claim.status));
}

std::string to_text(const std::vector<adjuster::schema::claim_state_t>& claims) {
  auto out = std::string{"["};
  for (auto it = std::begin(claims); it != std::end(claims); ++it) {
    if (it != std::begin(claims)) {
      out += ',';
    }
    out += to_text(*it);
  }
  out += ']';
  return out;
}

nlohmann::ordered_json to_json(const claim_event_record_t& record) {
  auto object = nlohmann::ordered_json::object();
  object["eventId"] = std::to_string(record.event_id);
  object["recordedAt"] = std::to_string(record.recorded_at);
  std::visit(
      overloaded{
          [&](const claim_submitted_t& event) {
            object["type"] = "ClaimSubmitted";
            object["claimId"] = std::to_string(event.claim_id);
            object["customerIdHash"] = hex(event.customer_id_hash);
            object["amount"] = to_string(event.amount);
            object["timestamp"] = std::to_string(event.timestamp);
            object["submitter"] = hex(event.submitter);
          },
          [&](const claim_status_updated_t& event) {
            object["type"] = "ClaimStatusUpdated";
            object["claimId"] = std::to_string(event.claim_id);
            object["oldStatus"] = std::string{to_string(event.old_status)};
            object["newStatus"] = std::string{to_string(event.new_status)};
            object["timestamp"] = std::to_string(event.timestamp);
            object["updater"] = hex(event.updater);
          },
          [&](const claim_processed_t& event) {
            object["type"] = "ClaimProcessed";
            object["claimId"] = std::to_string(event.claim_id);
            object["customerIdHash"] = hex(event.customer_id_hash);
            object["amount"] = to_string(event.amount);
            object["status"] = std::string{to_string(event.status)};
            object["timestamp"] = std::to_string(event.timestamp);
          },
          [&](const ownership_transferred_t& event) {
            object["type"] = "OwnershipTransferred";
            object["previousOwner"] = optional_account(event.previous_owner);
            object["newOwner"] = optional_account(event.new_owner);
          }},
      record.event);
  return object;
}

}  // namespace adjuster::registry
