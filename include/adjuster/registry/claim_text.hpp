#pragma once

#include <adjuster/schema/claim_event.hpp>
#include <adjuster/schema/claim_state.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Deterministic JSON rendering of claims. Field order is fixed, numbers are
// bare decimal digits (amounts keep all 256 bits) and the hash and status are
// strings:
// {"claimId":1,"customerIdHash":"0x..","amount":1000,"claimDate":1700000000,"status":"Submitted"}
namespace adjuster::registry {

std::string to_text(const adjuster::schema::claim_state_t& claim);
std::string to_text(const std::vector<adjuster::schema::claim_state_t>& claims);

/// Event log rows carry a "type" discriminator (ClaimSubmitted,
/// ClaimStatusUpdated, ClaimProcessed, OwnershipTransferred). Their numeric
/// fields are decimal strings so that they stay inside a json value.
nlohmann::ordered_json to_json(
    const adjuster::schema::claim_event_record_t& record);

}  // namespace adjuster::registry
