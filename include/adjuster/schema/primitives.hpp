#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace adjuster::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;  // Caller identity supplied by the host
using amount_t = boost::multiprecision::uint256_t;
using claim_id_t = uint64_t;
using event_id_t = uint64_t;
using timestamp_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_view_t& bytes);

std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();
bool is_zero_hash(const hash32_t& hash);

/// Lowercase hex without prefix.
std::string to_hex(const bytes_view_t& bytes);
/// Lowercase hex with a leading "0x".
std::string to_prefixed_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

/// Parse a plain decimal digit string into a 256-bit amount. Leading zeros
/// are allowed; signs, whitespace, exponents and values wider than 256 bits
/// are rejected.
std::optional<amount_t> try_parse_amount(std::string_view text);
std::string to_string(const amount_t& amount);

}  // namespace adjuster::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
