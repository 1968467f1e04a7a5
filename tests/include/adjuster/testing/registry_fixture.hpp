#pragma once

#include <adjuster/registry/claim_registry.hpp>
#include <adjuster/schema/encoding/scale/encoder.hpp>
#include <adjuster/storage/rocksdb/storage.hpp>
#include <adjuster/testing/common.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

namespace adjuster::testing {

using scale_encoder_t = adjuster::schema::encoding::encoder<
    adjuster::schema::encoding::scale_encoder_tag>;
using rocksdb_storage_t =
    adjuster::storage::storage<adjuster::storage::rocksdb_storage_tag>;

inline constexpr auto kInitialTime =
    adjuster::schema::timestamp_seconds_t{1'700'000'000};

/// Registry over a private RocksDB directory with a manually driven clock.
/// `reopen` closes and reopens the same directory to exercise restarts.
class registry_fixture final {
 public:
  explicit registry_fixture(const std::string_view db_prefix,
                            const adjuster::schema::account_id_t& deployer =
                                make_account(1))
      : db_path_{make_db_path(db_prefix)}, now_{kInitialTime} {
    open(deployer);
  }

  registry_fixture(const registry_fixture&) = delete;
  registry_fixture& operator=(const registry_fixture&) = delete;
  registry_fixture(registry_fixture&&) = delete;
  registry_fixture& operator=(registry_fixture&&) = delete;

  ~registry_fixture() {
    close();
    remove_path(db_path_);
  }

  adjuster::registry::claim_registry& registry() { return *registry_; }
  scale_encoder_t& encoder() { return encoder_; }
  rocksdb_storage_t& storage() { return *storage_; }
  const std::string& db_path() const { return db_path_; }

  adjuster::schema::timestamp_seconds_t now() const { return now_.load(); }
  void set_now(const adjuster::schema::timestamp_seconds_t value) {
    now_.store(value);
  }
  void advance(const adjuster::schema::timestamp_seconds_t seconds) {
    now_.fetch_add(seconds);
  }

  void reopen(const adjuster::schema::account_id_t& deployer = make_account(99)) {
    close();
    open(deployer);
  }

 private:
  void open(const adjuster::schema::account_id_t& deployer) {
    storage_ = std::make_unique<rocksdb_storage_t>(
        adjuster::storage::make_storage<adjuster::storage::rocksdb_storage_tag>(
            db_path_));
    registry_ = std::make_unique<adjuster::registry::claim_registry>(
        encoder_, *storage_, deployer, [this] { return now_.load(); });
  }

  void close() {
    registry_.reset();
    storage_.reset();
  }

  std::string db_path_;
  std::atomic<adjuster::schema::timestamp_seconds_t> now_;
  scale_encoder_t encoder_;
  std::unique_ptr<rocksdb_storage_t> storage_;
  std::unique_ptr<adjuster::registry::claim_registry> registry_;
};

}  // namespace adjuster::testing
