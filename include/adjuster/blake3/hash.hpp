#pragma once
#include <adjuster/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace adjuster::blake3 {

/// Incremental BLAKE3 over any number of updates; `finalize` may be called
/// once per hasher.
class hasher final {
 public:
  hasher();
  ~hasher();
  hasher(hasher&&) noexcept;
  hasher& operator=(hasher&&) noexcept;
  hasher(const hasher&) = delete;
  hasher& operator=(const hasher&) = delete;

  hasher& update(const std::string_view& str);
  hasher& update(const adjuster::schema::bytes_view_t& bytes);

  adjuster::schema::hash32_t finalize() const;

 private:
  struct state;
  std::unique_ptr<state> state_;
};

adjuster::schema::hash32_t hash(const std::string_view& str);
adjuster::schema::hash32_t hash(const adjuster::schema::bytes_view_t& bytes);

}  // namespace adjuster::blake3
