#include <adjuster/schema/key/builder.hpp>
#include <algorithm>
#include <iterator>

using namespace adjuster::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy(str, std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy(bytes, std::back_inserter(data));
  return *this;
}
