#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <adjuster/common/critical.hpp>
#include <adjuster/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace adjuster::storage {

namespace detail {

inline adjuster::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const adjuster::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const adjuster::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const adjuster::schema::bytes_view_t& prefix) const;
  void write_batch(const std::vector<key_value_entry_t>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const adjuster::schema::bytes_view_t& key) const {
  if (!database) {
    adjuster::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    adjuster::common::critical("Failed to get value from RocksDB");
  }
  auto decoded = encoder.template try_decode<T>(adjuster::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded) {
    adjuster::common::critical("Corrupt value stored under key '{}'",
                               adjuster::schema::to_hex(key));
  }
  return decoded;
}

}  // namespace adjuster::storage
