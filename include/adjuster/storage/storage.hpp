#pragma once
#include <adjuster/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace adjuster::storage {

using key_value_entry_t =
    std::pair<adjuster::schema::bytes_t, adjuster::schema::bytes_t>;

/// Durable key-value map the registry persists into. Backends specialise this
/// template on a tag type.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const adjuster::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in
  /// ascending key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const adjuster::schema::bytes_view_t& prefix) const;

  /// Commit all entries (already encoded) in one atomic write.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace adjuster::storage
