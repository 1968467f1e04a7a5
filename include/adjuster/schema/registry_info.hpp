#pragma once

#include <adjuster/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace adjuster::schema {

template <uint16_t Version>
struct registry_info;

template <>
struct registry_info<1> final {
  uint16_t schema_version{1};
  std::string data{"adjuster-claims"};
  std::string version{"0.1.0"};
  std::optional<account_id_t> owner;
  claim_id_t next_claim_id{1};
  uint64_t total_claims{};
  event_id_t next_event_id{1};
};

using registry_info_t = registry_info<1>;

}  // namespace adjuster::schema
