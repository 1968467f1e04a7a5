#include <adjuster/common/critical.hpp>
#include <adjuster/storage/rocksdb/storage.hpp>

namespace adjuster::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    adjuster::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const adjuster::schema::bytes_view_t& prefix) const {
  if (!database) {
    adjuster::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = adjuster::schema::make_string_view(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    adjuster::common::critical("Failed to iterate RocksDB");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    adjuster::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(adjuster::schema::make_bytes_view(key)),
                  detail::to_slice(adjuster::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      adjuster::common::critical("failed staging key in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    adjuster::common::critical("failed to commit write batch");
  }
}

}  // namespace adjuster::storage
