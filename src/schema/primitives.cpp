#include <adjuster/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

namespace adjuster::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

// 2^256 - 1 has 78 decimal digits.
constexpr auto kMaxAmountDigits = std::size_t{78};

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

bool is_zero_hash(const hash32_t& hash) {
  return std::ranges::all_of(hash, [](const uint8_t b) { return b == 0; });
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_prefixed_hex(const bytes_view_t& bytes) {
  return "0x" + to_hex(bytes);
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<amount_t> try_parse_amount(std::string_view text) {
  if (text.empty() ||
      !std::ranges::all_of(
          text, [](const char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  // Leading zeros do not count towards the width limit.
  auto first_digit = text.find_first_not_of('0');
  text = first_digit == std::string_view::npos ? text.substr(text.size() - 1)
                                               : text.substr(first_digit);
  if (text.size() > kMaxAmountDigits) {
    return std::nullopt;
  }

  // Accumulate in a wider type so a 78 digit value above 2^256 - 1 is
  // detected instead of wrapping.
  auto wide = boost::multiprecision::uint512_t{};
  for (const auto c : text) {
    wide *= 10u;
    wide += static_cast<unsigned>(c - '0');
  }
  if (wide > boost::multiprecision::uint512_t{
                 std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return static_cast<amount_t>(wide);
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace adjuster::schema
