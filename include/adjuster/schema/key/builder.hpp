#pragma once
#include <adjuster/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace adjuster::schema::key {

/// Appends key segments. Integers are written big-endian so that the byte
/// order of keys matches the numeric order of the ids inside them.
struct builder final {
  adjuster::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_unsigned_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace adjuster::schema::key
