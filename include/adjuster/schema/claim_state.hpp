#pragma once

#include <adjuster/schema/claim_status.hpp>
#include <adjuster/schema/primitives.hpp>
#include <cstdint>

// Schema type: claim state.
// Claim lifecycle: one persisted insurance claim. Only the status ever changes
// after creation; the raw customer identifier is never stored.
namespace adjuster::schema {

template <uint16_t Version>
struct claim_state;

template <>
struct claim_state<1> final {
  uint16_t version{1};
  claim_id_t claim_id{};
  hash32_t customer_id_hash{};
  amount_t amount{};
  timestamp_seconds_t claim_date{};
  claim_status_t status{claim_status_t::submitted};
};

using claim_state_t = claim_state<1>;

}  // namespace adjuster::schema
