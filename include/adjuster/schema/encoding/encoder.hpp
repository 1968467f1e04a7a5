#pragma once
#include <adjuster/schema/primitives.hpp>
#include <optional>
#include <span>

namespace adjuster::schema::encoding {

// Binary codec used for every value that reaches the durable store. The
// library is picked at build time through the tag; there is exactly one
// (SCALE) today.
template <typename Library>
struct encoder {
  template <typename T>
  adjuster::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const adjuster::schema::bytes_view_t& bytes);
};

}  // namespace adjuster::schema::encoding
