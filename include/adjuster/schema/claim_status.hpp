#pragma once

#include <adjuster/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: claim status.
// Claim lifecycle: every claim starts Submitted; Approved and Rejected are
// terminal and accept no further transition.
namespace adjuster::schema {

enum class claim_status_t : uint8_t { submitted = 0, approved = 1, rejected = 2 };

inline constexpr auto kClaimStatusMappings = std::array{
    std::pair<std::string_view, claim_status_t>{"Submitted",
                                                claim_status_t::submitted},
    std::pair<std::string_view, claim_status_t>{"Approved",
                                                claim_status_t::approved},
    std::pair<std::string_view, claim_status_t>{"Rejected",
                                                claim_status_t::rejected}};

inline constexpr auto kClaimStatusLowerMappings = std::array{
    std::pair<std::string_view, claim_status_t>{"submitted",
                                                claim_status_t::submitted},
    std::pair<std::string_view, claim_status_t>{"approved",
                                                claim_status_t::approved},
    std::pair<std::string_view, claim_status_t>{"rejected",
                                                claim_status_t::rejected}};

template <>
inline std::optional<claim_status_t> try_from_string<claim_status_t>(
    const std::string_view value) {
  if (auto status = from_string(value, kClaimStatusMappings)) {
    return status;
  }
  return from_string(value, kClaimStatusLowerMappings);
}

inline constexpr std::string_view to_string(const claim_status_t value) {
  return to_string(value, kClaimStatusMappings).value_or("Unknown");
}

/// False for numeric values outside the defined set (only reachable through a
/// cast or a corrupt record).
inline constexpr bool is_valid(const claim_status_t value) {
  return to_string(value, kClaimStatusMappings).has_value();
}

inline constexpr bool is_terminal(const claim_status_t value) {
  return value == claim_status_t::approved || value == claim_status_t::rejected;
}

}  // namespace adjuster::schema
