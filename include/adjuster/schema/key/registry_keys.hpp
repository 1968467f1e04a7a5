#pragma once
#include <adjuster/schema/primitives.hpp>
#include <optional>
#include <string_view>

// Storage key layout of the claim registry.
namespace adjuster::schema::key {

inline constexpr auto kClaimPrefix = std::string_view{"CLAIM|"};
inline constexpr auto kCustomerIndexPrefix = std::string_view{"CUSTOMER|"};
inline constexpr auto kEventPrefix = std::string_view{"EVENT|"};
inline constexpr auto kNextClaimIdKey =
    std::string_view{"SYS|REGISTRY|NEXT_CLAIM_ID"};
inline constexpr auto kNextEventIdKey =
    std::string_view{"SYS|REGISTRY|NEXT_EVENT_ID"};
inline constexpr auto kOwnerKey = std::string_view{"SYS|REGISTRY|OWNER"};

/// CLAIM|<be64 claim_id>
bytes_t make_claim_key(claim_id_t claim_id);

/// CUSTOMER|<customer hash>|
bytes_t make_customer_index_prefix(const hash32_t& customer_id_hash);

/// CUSTOMER|<customer hash>|<be64 claim_id>
bytes_t make_customer_index_key(const hash32_t& customer_id_hash,
                                claim_id_t claim_id);

/// EVENT|<be64 event_id>
bytes_t make_event_key(event_id_t event_id);

bytes_t make_system_key(std::string_view name);

/// Read back the trailing big-endian id of a claim, index or event key.
std::optional<uint64_t> try_parse_trailing_id(const bytes_view_t& key);

}  // namespace adjuster::schema::key
