#pragma once

#include <adjuster/schema/claim_status.hpp>
#include <adjuster/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <variant>

// Schema type: claim events.
// Notifications emitted by registry mutations. They are informational only:
// returned to the caller and appended to the persisted event log.
namespace adjuster::schema {

template <uint16_t Version>
struct claim_submitted;

template <>
struct claim_submitted<1> final {
  uint16_t version{1};
  claim_id_t claim_id{};
  hash32_t customer_id_hash{};
  amount_t amount{};
  timestamp_seconds_t timestamp{};
  account_id_t submitter{};
};

template <uint16_t Version>
struct claim_status_updated;

template <>
struct claim_status_updated<1> final {
  uint16_t version{1};
  claim_id_t claim_id{};
  claim_status_t old_status{};
  claim_status_t new_status{};
  timestamp_seconds_t timestamp{};
  account_id_t updater{};
};

/// Emitted only when a claim enters a terminal status.
template <uint16_t Version>
struct claim_processed;

template <>
struct claim_processed<1> final {
  uint16_t version{1};
  claim_id_t claim_id{};
  hash32_t customer_id_hash{};
  amount_t amount{};
  claim_status_t status{};
  timestamp_seconds_t timestamp{};
};

/// An absent owner means "no owner": the registry was just created
/// (previous) or ownership was renounced (next).
template <uint16_t Version>
struct ownership_transferred;

template <>
struct ownership_transferred<1> final {
  uint16_t version{1};
  std::optional<account_id_t> previous_owner;
  std::optional<account_id_t> new_owner;
};

using claim_submitted_t = claim_submitted<1>;
using claim_status_updated_t = claim_status_updated<1>;
using claim_processed_t = claim_processed<1>;
using ownership_transferred_t = ownership_transferred<1>;

using claim_event_t = std::variant<claim_submitted_t,
                                   claim_status_updated_t,
                                   claim_processed_t,
                                   ownership_transferred_t>;

template <uint16_t Version>
struct claim_event_record;

template <>
struct claim_event_record<1> final {
  uint16_t version{1};
  event_id_t event_id{};
  timestamp_seconds_t recorded_at{};
  claim_event_t event;
};

using claim_event_record_t = claim_event_record<1>;

}  // namespace adjuster::schema
