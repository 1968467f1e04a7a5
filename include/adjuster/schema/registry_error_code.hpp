#pragma once

#include <adjuster/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: registry error code.
// Stable numeric failure codes returned in operation results; 0 is success.
namespace adjuster::schema {

enum class registry_error_code : uint32_t {
  invalid_amount = 1,
  claim_not_found = 2,
  status_already_set = 3,
  invalid_status = 4,
  unauthorized = 5,
  invalid_owner = 6,
};

inline constexpr auto kRegistryErrorCodeMappings = std::array{
    std::pair<std::string_view, registry_error_code>{
        "InvalidAmount", registry_error_code::invalid_amount},
    std::pair<std::string_view, registry_error_code>{
        "ClaimNotFound", registry_error_code::claim_not_found},
    std::pair<std::string_view, registry_error_code>{
        "StatusAlreadySet", registry_error_code::status_already_set},
    std::pair<std::string_view, registry_error_code>{
        "InvalidStatus", registry_error_code::invalid_status},
    std::pair<std::string_view, registry_error_code>{
        "Unauthorized", registry_error_code::unauthorized},
    std::pair<std::string_view, registry_error_code>{
        "InvalidOwner", registry_error_code::invalid_owner}};

template <>
inline std::optional<registry_error_code> try_from_string<registry_error_code>(
    const std::string_view value) {
  return from_string(value, kRegistryErrorCodeMappings);
}

inline constexpr std::string_view to_string(const registry_error_code value) {
  return to_string(value, kRegistryErrorCodeMappings).value_or("Unknown");
}

}  // namespace adjuster::schema
