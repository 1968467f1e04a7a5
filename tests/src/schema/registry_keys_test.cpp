#include <gtest/gtest.h>
#include <adjuster/schema/key/registry_keys.hpp>
#include <adjuster/testing/common.hpp>

#include <algorithm>
#include <vector>

namespace key = adjuster::schema::key;

TEST(registry_keys, claim_keys_sort_in_numeric_order) {
  auto ids = std::vector<adjuster::schema::claim_id_t>{1, 2, 255, 256, 65536,
                                                       1ull << 40};
  auto keys = std::vector<adjuster::schema::bytes_t>{};
  for (auto id : ids) {
    keys.push_back(key::make_claim_key(id));
  }
  EXPECT_TRUE(std::ranges::is_sorted(keys));
}

TEST(registry_keys, claim_key_layout) {
  auto claim_key = key::make_claim_key(258);
  auto expected = adjuster::schema::make_bytes(std::string_view{"CLAIM|"});
  expected.insert(std::end(expected), {0, 0, 0, 0, 0, 0, 1, 2});
  EXPECT_EQ(claim_key, expected);
}

TEST(registry_keys, customer_index_key_extends_prefix) {
  auto customer = adjuster::testing::make_hash(9);
  auto prefix = key::make_customer_index_prefix(customer);
  auto index_key = key::make_customer_index_key(customer, 42);
  ASSERT_EQ(index_key.size(), prefix.size() + sizeof(uint64_t));
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), index_key.begin()));

  auto other = key::make_customer_index_prefix(adjuster::testing::make_hash(10));
  EXPECT_NE(prefix, other);
}

TEST(registry_keys, trailing_id_round_trips) {
  auto event_key = key::make_event_key(123456789);
  auto parsed =
      key::try_parse_trailing_id(adjuster::schema::make_bytes_view(event_key));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, 123456789u);

  auto short_key = adjuster::schema::bytes_t{1, 2, 3};
  EXPECT_FALSE(
      key::try_parse_trailing_id(adjuster::schema::make_bytes_view(short_key)));
}
