#include <spdlog/spdlog.h>
#include <adjuster/blake3/hash.hpp>
#include <adjuster/registry/claim_registry.hpp>
#include <adjuster/registry/claim_text.hpp>
#include <adjuster/schema/key/registry_keys.hpp>
#include <algorithm>
#include <chrono>
#include <iterator>
#include <mutex>
#include <utility>

using namespace adjuster::schema;

namespace {

constexpr auto kSubmitCodespace = std::string_view{"adjuster.submit"};
constexpr auto kUpdateStatusCodespace =
    std::string_view{"adjuster.update_status"};
constexpr auto kGetCodespace = std::string_view{"adjuster.get"};
constexpr auto kVerifyCodespace = std::string_view{"adjuster.verify"};
constexpr auto kSerializeCodespace = std::string_view{"adjuster.serialize"};
constexpr auto kTransferOwnershipCodespace =
    std::string_view{"adjuster.transfer_ownership"};
constexpr auto kRenounceOwnershipCodespace =
    std::string_view{"adjuster.renounce_ownership"};

template <typename T>
operation_result<T> make_failure(const registry_error_code code,
                                 const std::string_view codespace,
                                 std::string log) {
  spdlog::warn("{} rejected with {}: {}", codespace, to_string(code), log);
  auto result = operation_result<T>{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{codespace};
  return result;
}

std::string describe(const std::optional<account_id_t>& account) {
  if (!account) {
    return "none";
  }
  return to_prefixed_hex(bytes_view_t{*account});
}

}  // namespace

namespace adjuster::registry {

struct claim_registry::mutation final {
  std::vector<adjuster::storage::key_value_entry_t> entries;
  std::vector<claim_event_t> events;
};

clock_source_t system_clock() {
  return [] {
    return static_cast<timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

bool has_registry(
    adjuster::schema::encoding::encoder<
        adjuster::schema::encoding::scale_encoder_tag>& encoder,
    const adjuster::storage::storage<adjuster::storage::rocksdb_storage_tag>&
        storage) {
  auto next_claim_key = key::make_system_key(key::kNextClaimIdKey);
  return storage.get<claim_id_t>(encoder, make_bytes_view(next_claim_key))
      .has_value();
}

claim_registry::claim_registry(
    adjuster::schema::encoding::encoder<
        adjuster::schema::encoding::scale_encoder_tag>& encoder,
    adjuster::storage::storage<adjuster::storage::rocksdb_storage_tag>&
        storage,
    const account_id_t& deployer,
    clock_source_t clock)
    : encoder_{encoder}, storage_{storage}, clock_{std::move(clock)} {
  auto lock = std::unique_lock{mutex_};
  if (!clock_) {
    adjuster::common::critical("claim registry requires a clock source");
  }
  load_persisted_state(deployer);
  spdlog::info("Claim registry ready: owner {}, next claim id {}",
               describe(owner_), next_claim_id_);
}

operation_result<claim_id_t> claim_registry::submit_claim(
    const account_id_t& caller,
    const std::string_view customer_id,
    const amount_t& amount) {
  auto lock = std::unique_lock{mutex_};
  if (amount == 0) {
    return make_failure<claim_id_t>(registry_error_code::invalid_amount,
                                    kSubmitCodespace,
                                    "claim amount must be greater than zero");
  }

  auto now = clock_();
  auto claim = claim_state_t{.claim_id = next_claim_id_,
                             .customer_id_hash = adjuster::blake3::hash(customer_id),
                             .amount = amount,
                             .claim_date = now,
                             .status = claim_status_t::submitted};

  auto pending = mutation{};
  pending.entries.emplace_back(key::make_claim_key(claim.claim_id),
                               encoder_.encode(claim));
  pending.entries.emplace_back(
      key::make_customer_index_key(claim.customer_id_hash, claim.claim_id),
      bytes_t{});
  pending.entries.emplace_back(key::make_system_key(key::kNextClaimIdKey),
                               encoder_.encode(claim.claim_id + 1));
  pending.events.emplace_back(
      claim_submitted_t{.claim_id = claim.claim_id,
                        .customer_id_hash = claim.customer_id_hash,
                        .amount = claim.amount,
                        .timestamp = now,
                        .submitter = caller});
  commit(pending, now);
  next_claim_id_ = claim.claim_id + 1;

  spdlog::info("Claim {} submitted by {} for amount {}", claim.claim_id,
               describe(caller), to_string(claim.amount));

  auto result = operation_result<claim_id_t>{};
  result.value = claim.claim_id;
  result.events = std::move(pending.events);
  return result;
}

operation_result<std::monostate> claim_registry::update_claim_status(
    const account_id_t& caller,
    const claim_id_t claim_id,
    const claim_status_t new_status) {
  auto lock = std::unique_lock{mutex_};
  if (!is_owner(caller)) {
    return make_failure<std::monostate>(
        registry_error_code::unauthorized, kUpdateStatusCodespace,
        fmt::format("caller {} is not the registry owner", describe(caller)));
  }

  auto claim = load_claim(claim_id);
  if (!claim) {
    return make_failure<std::monostate>(
        registry_error_code::claim_not_found, kUpdateStatusCodespace,
        fmt::format("claim {} does not exist", claim_id));
  }

  if (!is_valid(new_status)) {
    return make_failure<std::monostate>(
        registry_error_code::invalid_status, kUpdateStatusCodespace,
        fmt::format("status value {} is not a claim status",
                    static_cast<uint32_t>(new_status)));
  }

  if (claim->status == new_status) {
    return make_failure<std::monostate>(
        registry_error_code::status_already_set, kUpdateStatusCodespace,
        fmt::format("claim {} is already {}", claim_id,
                    to_string(claim->status)));
  }

  // Approved and Rejected are final. The rejection reuses StatusAlreadySet.
  if (is_terminal(claim->status)) {
    return make_failure<std::monostate>(
        registry_error_code::status_already_set, kUpdateStatusCodespace,
        fmt::format("claim {} is already {} and cannot move to {}", claim_id,
                    to_string(claim->status), to_string(new_status)));
  }

  auto now = clock_();
  auto old_status = claim->status;
  claim->status = new_status;

  auto pending = mutation{};
  pending.entries.emplace_back(key::make_claim_key(claim_id),
                               encoder_.encode(*claim));
  pending.events.emplace_back(
      claim_status_updated_t{.claim_id = claim_id,
                             .old_status = old_status,
                             .new_status = new_status,
                             .timestamp = now,
                             .updater = caller});
  if (is_terminal(new_status)) {
    pending.events.emplace_back(
        claim_processed_t{.claim_id = claim_id,
                          .customer_id_hash = claim->customer_id_hash,
                          .amount = claim->amount,
                          .status = new_status,
                          .timestamp = now});
  }
  commit(pending, now);

  spdlog::info("Claim {} status {} -> {}", claim_id, to_string(old_status),
               to_string(new_status));

  auto result = operation_result<std::monostate>{};
  result.value = std::monostate{};
  result.events = std::move(pending.events);
  return result;
}

operation_result<claim_state_t> claim_registry::get_claim(
    const claim_id_t claim_id) const {
  auto lock = std::shared_lock{mutex_};
  auto claim = load_claim(claim_id);
  if (!claim) {
    return make_failure<claim_state_t>(
        registry_error_code::claim_not_found, kGetCodespace,
        fmt::format("claim {} does not exist", claim_id));
  }
  auto result = operation_result<claim_state_t>{};
  result.value = std::move(claim);
  return result;
}

operation_result<bool> claim_registry::verify_claim_ownership(
    const claim_id_t claim_id,
    const std::string_view customer_id) const {
  auto lock = std::shared_lock{mutex_};
  auto claim = load_claim(claim_id);
  if (!claim) {
    return make_failure<bool>(registry_error_code::claim_not_found,
                              kVerifyCodespace,
                              fmt::format("claim {} does not exist", claim_id));
  }
  auto result = operation_result<bool>{};
  result.value = adjuster::blake3::hash(customer_id) == claim->customer_id_hash;
  return result;
}

operation_result<std::string> claim_registry::serialize_claim(
    const claim_id_t claim_id) const {
  auto lock = std::shared_lock{mutex_};
  auto claim = load_claim(claim_id);
  if (!claim) {
    return make_failure<std::string>(
        registry_error_code::claim_not_found, kSerializeCodespace,
        fmt::format("claim {} does not exist", claim_id));
  }
  auto result = operation_result<std::string>{};
  result.value = to_text(*claim);
  return result;
}

std::string claim_registry::list_customer_claims_as_text(
    const std::string_view customer_id) const {
  auto lock = std::shared_lock{mutex_};
  auto customer_id_hash = adjuster::blake3::hash(customer_id);
  auto prefix = key::make_customer_index_prefix(customer_id_hash);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));

  // Index keys end in the big-endian claim id, so rows arrive in id order.
  auto claims = std::vector<claim_state_t>{};
  claims.reserve(rows.size());
  for (const auto& row : rows) {
    const auto& row_key = row.first;
    auto claim_id = key::try_parse_trailing_id(make_bytes_view(row_key));
    if (row_key.size() != prefix.size() + sizeof(claim_id_t) || !claim_id) {
      adjuster::common::critical("corrupt customer index row '{}'",
                                 to_hex(make_bytes_view(row_key)));
    }
    auto claim = load_claim(*claim_id);
    if (!claim || claim->customer_id_hash != customer_id_hash) {
      spdlog::warn(
          "Customer index row for claim {} does not match a stored claim of "
          "this customer",
          *claim_id);
      continue;
    }
    claims.push_back(std::move(*claim));
  }
  return to_text(claims);
}

operation_result<std::monostate> claim_registry::transfer_ownership(
    const account_id_t& caller,
    const account_id_t& new_owner) {
  auto lock = std::unique_lock{mutex_};
  if (!is_owner(caller)) {
    return make_failure<std::monostate>(
        registry_error_code::unauthorized, kTransferOwnershipCodespace,
        fmt::format("caller {} is not the registry owner", describe(caller)));
  }
  if (is_zero_hash(new_owner)) {
    return make_failure<std::monostate>(registry_error_code::invalid_owner,
                                        kTransferOwnershipCodespace,
                                        "new owner must not be the zero identity");
  }

  auto now = clock_();
  auto previous = owner_;
  auto next = std::optional<account_id_t>{new_owner};

  auto pending = mutation{};
  pending.entries.emplace_back(key::make_system_key(key::kOwnerKey),
                               encoder_.encode(next));
  pending.events.emplace_back(
      ownership_transferred_t{.previous_owner = previous, .new_owner = next});
  commit(pending, now);
  owner_ = next;

  spdlog::info("Registry ownership transferred from {} to {}",
               describe(previous), describe(next));

  auto result = operation_result<std::monostate>{};
  result.value = std::monostate{};
  result.events = std::move(pending.events);
  return result;
}

operation_result<std::monostate> claim_registry::renounce_ownership(
    const account_id_t& caller) {
  auto lock = std::unique_lock{mutex_};
  if (!is_owner(caller)) {
    return make_failure<std::monostate>(
        registry_error_code::unauthorized, kRenounceOwnershipCodespace,
        fmt::format("caller {} is not the registry owner", describe(caller)));
  }

  auto now = clock_();
  auto previous = owner_;
  auto next = std::optional<account_id_t>{};

  auto pending = mutation{};
  pending.entries.emplace_back(key::make_system_key(key::kOwnerKey),
                               encoder_.encode(next));
  pending.events.emplace_back(
      ownership_transferred_t{.previous_owner = previous, .new_owner = next});
  commit(pending, now);
  owner_.reset();

  spdlog::info("Registry ownership renounced by {}", describe(previous));

  auto result = operation_result<std::monostate>{};
  result.value = std::monostate{};
  result.events = std::move(pending.events);
  return result;
}

std::optional<account_id_t> claim_registry::owner() const {
  auto lock = std::shared_lock{mutex_};
  return owner_;
}

registry_info_t claim_registry::info() const {
  auto lock = std::shared_lock{mutex_};
  auto result = registry_info_t{};
  result.owner = owner_;
  result.next_claim_id = next_claim_id_;
  result.total_claims = next_claim_id_ - 1;
  result.next_event_id = next_event_id_;
  return result;
}

std::vector<claim_event_record_t> claim_registry::events(
    const event_id_t from_id,
    const event_id_t to_id) const {
  auto lock = std::shared_lock{mutex_};
  auto records = std::vector<claim_event_record_t>{};
  auto first = std::max<event_id_t>(from_id, 1);
  auto last = std::min<event_id_t>(to_id, next_event_id_ - 1);
  for (auto event_id = first; event_id <= last; ++event_id) {
    auto event_key = key::make_event_key(event_id);
    auto record =
        storage_.get<claim_event_record_t>(encoder_, make_bytes_view(event_key));
    if (!record) {
      adjuster::common::critical("event {} missing from the event log",
                                 event_id);
    }
    records.push_back(std::move(*record));
  }
  return records;
}

void claim_registry::commit(mutation& pending, const timestamp_seconds_t now) {
  auto next_event_id = next_event_id_;
  for (const auto& event : pending.events) {
    auto record = claim_event_record_t{
        .event_id = next_event_id, .recorded_at = now, .event = event};
    pending.entries.emplace_back(key::make_event_key(next_event_id),
                                 encoder_.encode(record));
    ++next_event_id;
  }
  pending.entries.emplace_back(key::make_system_key(key::kNextEventIdKey),
                               encoder_.encode(next_event_id));
  storage_.write_batch(pending.entries);
  next_event_id_ = next_event_id;
}

std::optional<claim_state_t> claim_registry::load_claim(
    const claim_id_t claim_id) const {
  if (claim_id == 0 || claim_id >= next_claim_id_) {
    return std::nullopt;
  }
  auto claim_key = key::make_claim_key(claim_id);
  return storage_.get<claim_state_t>(encoder_, make_bytes_view(claim_key));
}

bool claim_registry::is_owner(const account_id_t& caller) const {
  return owner_.has_value() && *owner_ == caller;
}

void claim_registry::load_persisted_state(const account_id_t& deployer) {
  auto next_claim_key = key::make_system_key(key::kNextClaimIdKey);
  auto next_claim_id =
      storage_.get<claim_id_t>(encoder_, make_bytes_view(next_claim_key));
  if (next_claim_id) {
    auto next_event_key = key::make_system_key(key::kNextEventIdKey);
    auto owner_key = key::make_system_key(key::kOwnerKey);
    next_claim_id_ = *next_claim_id;
    next_event_id_ =
        storage_.get<event_id_t>(encoder_, make_bytes_view(next_event_key))
            .value_or(1);
    owner_ = storage_
                 .get<std::optional<account_id_t>>(encoder_,
                                                   make_bytes_view(owner_key))
                 .value_or(std::nullopt);
    spdlog::debug("Restored registry state: next claim {}, next event {}",
                  next_claim_id_, next_event_id_);
    return;
  }

  if (is_zero_hash(deployer)) {
    adjuster::common::critical(
        "cannot create a claim registry owned by the zero identity");
  }

  spdlog::debug("Initializing new claim registry");
  auto now = clock_();
  auto initial_owner = std::optional<account_id_t>{deployer};

  auto pending = mutation{};
  pending.entries.emplace_back(next_claim_key, encoder_.encode(claim_id_t{1}));
  pending.entries.emplace_back(key::make_system_key(key::kOwnerKey),
                               encoder_.encode(initial_owner));
  pending.events.emplace_back(ownership_transferred_t{
      .previous_owner = std::nullopt, .new_owner = initial_owner});
  next_claim_id_ = 1;
  next_event_id_ = 1;
  commit(pending, now);
  owner_ = initial_owner;
}

}  // namespace adjuster::registry
