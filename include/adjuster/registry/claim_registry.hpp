#pragma once

#include <adjuster/schema/claim_event.hpp>
#include <adjuster/schema/claim_state.hpp>
#include <adjuster/schema/claim_status.hpp>
#include <adjuster/schema/encoding/scale/encoder.hpp>
#include <adjuster/schema/operation_result.hpp>
#include <adjuster/schema/primitives.hpp>
#include <adjuster/schema/registry_info.hpp>
#include <adjuster/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace adjuster::registry {

/// Source of "now" for claim dates and event records, in UNIX seconds.
using clock_source_t = std::function<adjuster::schema::timestamp_seconds_t()>;

/// Clock backed by std::chrono::system_clock.
clock_source_t system_clock();

/// True when `storage` already holds a registry, so opening it needs no
/// deployer.
bool has_registry(
    adjuster::schema::encoding::encoder<
        adjuster::schema::encoding::scale_encoder_tag>& encoder,
    const adjuster::storage::storage<adjuster::storage::rocksdb_storage_tag>&
        storage);

/// Insurance claim registry.
///
/// Owns the claim table, the claim id sequence and the single privileged
/// owner identity. Every public call is one atomic request/response: input is
/// validated first, then all writes of a successful call (record, counters,
/// customer index rows, event log rows) are committed in one storage batch.
/// Mutations hold the registry lock exclusively, queries hold it shared.
class claim_registry final {
 public:
  /// Open the registry on top of `storage`.
  ///
  /// On an empty store `deployer` becomes the owner and the counters start at
  /// 1. On a store that already holds a registry, the persisted owner and
  /// counters are restored and `deployer` is ignored.
  explicit claim_registry(
      adjuster::schema::encoding::encoder<
          adjuster::schema::encoding::scale_encoder_tag>& encoder,
      adjuster::storage::storage<adjuster::storage::rocksdb_storage_tag>&
          storage,
      const adjuster::schema::account_id_t& deployer,
      clock_source_t clock = system_clock());

  /// Record a new claim for `customer_id` and return its id.
  ///
  /// Open to any caller. Fails with InvalidAmount when `amount` is zero.
  /// Only the BLAKE3 hash of `customer_id` is stored.
  adjuster::schema::operation_result<adjuster::schema::claim_id_t>
  submit_claim(const adjuster::schema::account_id_t& caller,
               std::string_view customer_id,
               const adjuster::schema::amount_t& amount);

  /// Owner-only status change.
  ///
  /// Checks, in order: Unauthorized, ClaimNotFound, InvalidStatus,
  /// StatusAlreadySet. Approved and Rejected are terminal: any change away
  /// from them is reported as StatusAlreadySet.
  adjuster::schema::operation_result<std::monostate> update_claim_status(
      const adjuster::schema::account_id_t& caller,
      adjuster::schema::claim_id_t claim_id,
      adjuster::schema::claim_status_t new_status);

  adjuster::schema::operation_result<adjuster::schema::claim_state_t>
  get_claim(adjuster::schema::claim_id_t claim_id) const;

  /// True when `customer_id` hashes to the hash stored on the claim.
  adjuster::schema::operation_result<bool> verify_claim_ownership(
      adjuster::schema::claim_id_t claim_id,
      std::string_view customer_id) const;

  adjuster::schema::operation_result<std::string> serialize_claim(
      adjuster::schema::claim_id_t claim_id) const;

  /// JSON array of every claim of `customer_id`, ascending by id; "[]" when
  /// the customer has none.
  std::string list_customer_claims_as_text(std::string_view customer_id) const;

  adjuster::schema::operation_result<std::monostate> transfer_ownership(
      const adjuster::schema::account_id_t& caller,
      const adjuster::schema::account_id_t& new_owner);

  /// Drop the owner permanently. Owner-only operations fail afterwards.
  adjuster::schema::operation_result<std::monostate> renounce_ownership(
      const adjuster::schema::account_id_t& caller);

  std::optional<adjuster::schema::account_id_t> owner() const;

  adjuster::schema::registry_info_t info() const;

  /// Persisted notifications with ids in the inclusive range.
  std::vector<adjuster::schema::claim_event_record_t> events(
      adjuster::schema::event_id_t from_id,
      adjuster::schema::event_id_t to_id) const;

 private:
  struct mutation;

  /// Append event records and the event counter to the batch, write it and
  /// advance the in-memory event counter.
  void commit(mutation& pending, adjuster::schema::timestamp_seconds_t now);

  std::optional<adjuster::schema::claim_state_t> load_claim(
      adjuster::schema::claim_id_t claim_id) const;

  bool is_owner(const adjuster::schema::account_id_t& caller) const;

  /// Restore owner/counters from storage or initialise a fresh registry.
  void load_persisted_state(const adjuster::schema::account_id_t& deployer);

  mutable std::shared_mutex mutex_;
  adjuster::schema::encoding::encoder<
      adjuster::schema::encoding::scale_encoder_tag>& encoder_;
  adjuster::storage::storage<adjuster::storage::rocksdb_storage_tag>& storage_;
  clock_source_t clock_;
  std::optional<adjuster::schema::account_id_t> owner_;
  adjuster::schema::claim_id_t next_claim_id_{1};
  adjuster::schema::event_id_t next_event_id_{1};
};

}  // namespace adjuster::registry
