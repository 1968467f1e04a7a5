#include <adjuster/blake3/hash.hpp>
#include <adjuster/registry/claim_text.hpp>
#include <adjuster/schema/key/registry_keys.hpp>
#include <adjuster/testing/registry_fixture.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using adjuster::schema::claim_status_t;

namespace {

const auto kOwner = adjuster::testing::make_account(1);
const auto kCaller = adjuster::testing::make_account(4);

std::string hash_hex(const std::string_view customer) {
  return adjuster::schema::to_prefixed_hex(
      adjuster::schema::bytes_view_t{adjuster::blake3::hash(customer)});
}

std::string expected_object(const uint64_t claim_id,
                            const std::string_view customer,
                            const std::string_view amount,
                            const uint64_t claim_date,
                            const std::string_view status) {
  return "{\"claimId\":" + std::to_string(claim_id) +
         ",\"customerIdHash\":\"" + hash_hex(customer) + "\",\"amount\":" +
         std::string{amount} + ",\"claimDate\":" + std::to_string(claim_date) +
         ",\"status\":\"" + std::string{status} + "\"}";
}

}  // namespace

TEST(claim_text, claim_object_has_fixed_field_order_and_bare_numbers) {
  auto claim = adjuster::schema::claim_state_t{
      .claim_id = 12,
      .customer_id_hash = adjuster::blake3::hash(std::string_view{"USER123"}),
      .amount = adjuster::schema::amount_t{1'000'000'000'000'000'000ull},
      .claim_date = 1'700'000'123,
      .status = claim_status_t::approved};

  EXPECT_EQ(adjuster::registry::to_text(claim),
            expected_object(12, "USER123", "1000000000000000000", 1'700'000'123,
                            "Approved"));
}

TEST(claim_text, unknown_status_value_renders_as_unknown) {
  auto claim = adjuster::schema::claim_state_t{
      .claim_id = 1, .amount = 5, .status = static_cast<claim_status_t>(42)};
  auto parsed = nlohmann::json::parse(adjuster::registry::to_text(claim));
  EXPECT_EQ(parsed["status"], "Unknown");
  EXPECT_EQ(parsed["customerIdHash"].get<std::string>().size(), 66u);
  EXPECT_TRUE(parsed["claimId"].is_number_unsigned());
  EXPECT_EQ(parsed["amount"].get<uint64_t>(), 5u);
}

TEST(claim_text, large_amounts_keep_every_digit) {
  auto amount = *adjuster::schema::try_parse_amount(
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639935");
  auto claim = adjuster::schema::claim_state_t{.claim_id = 1, .amount = amount};
  auto text = adjuster::registry::to_text(claim);
  EXPECT_NE(text.find("\"amount\":"
                      "115792089237316195423570985008687907853269984665640564039"
                      "457584007913129639935,"),
            std::string::npos);
  EXPECT_TRUE(nlohmann::json::accept(text));
}

TEST(claim_text, serialize_claim_uses_stored_record) {
  auto fixture = adjuster::testing::registry_fixture{"adjuster_text_serialize", kOwner};
  auto& registry = fixture.registry();
  ASSERT_TRUE(registry.submit_claim(kCaller, "USER123", 250).ok());
  ASSERT_TRUE(
      registry.update_claim_status(kOwner, 1, claim_status_t::rejected).ok());

  auto text = registry.serialize_claim(1);
  ASSERT_TRUE(text.ok());
  EXPECT_EQ(*text.value,
            expected_object(1, "USER123", "250", fixture.now(), "Rejected"));
}

TEST(claim_text, customer_listing_returns_only_matching_claims_in_order) {
  auto fixture = adjuster::testing::registry_fixture{"adjuster_text_list", kOwner};
  auto& registry = fixture.registry();

  ASSERT_TRUE(registry.submit_claim(kCaller, "USER123", 10).ok());
  fixture.advance(5);
  ASSERT_TRUE(registry.submit_claim(kCaller, "OTHER", 20).ok());
  fixture.advance(5);
  ASSERT_TRUE(registry.submit_claim(kOwner, "USER123", 30).ok());
  ASSERT_TRUE(
      registry.update_claim_status(kOwner, 3, claim_status_t::approved).ok());

  auto expected = "[" +
                  expected_object(1, "USER123", "10",
                                  adjuster::testing::kInitialTime, "Submitted") +
                  "," +
                  expected_object(3, "USER123", "30",
                                  adjuster::testing::kInitialTime + 10,
                                  "Approved") +
                  "]";
  EXPECT_EQ(registry.list_customer_claims_as_text("USER123"), expected);

  auto other = nlohmann::json::parse(registry.list_customer_claims_as_text("OTHER"));
  ASSERT_EQ(other.size(), 1u);
  EXPECT_EQ(other[0]["claimId"], 2u);
}

TEST(claim_text, customer_listing_is_empty_array_without_claims) {
  auto fixture = adjuster::testing::registry_fixture{"adjuster_text_empty"};
  EXPECT_EQ(fixture.registry().list_customer_claims_as_text("NOBODY"), "[]");
}

TEST(claim_text, listing_reads_claim_ids_from_index_keys) {
  auto fixture = adjuster::testing::registry_fixture{"adjuster_text_index"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(registry.submit_claim(kCaller, "USER123", 10).ok());
  ASSERT_TRUE(registry.submit_claim(kCaller, "OTHER", 20).ok());

  auto customer = adjuster::blake3::hash(std::string_view{"USER123"});
  auto prefix = adjuster::schema::key::make_customer_index_prefix(customer);
  auto rows = fixture.storage().list_by_prefix(
      adjuster::schema::make_bytes_view(prefix));
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].first,
            adjuster::schema::key::make_customer_index_key(customer, 1));
  EXPECT_TRUE(rows[0].second.empty());

  // Rows naming an unassigned claim or another customer's claim are skipped.
  fixture.storage().write_batch(
      {{adjuster::schema::key::make_customer_index_key(customer, 2), {}},
       {adjuster::schema::key::make_customer_index_key(customer, 77), {}}});
  EXPECT_EQ(registry.list_customer_claims_as_text("USER123"),
            "[" +
                expected_object(1, "USER123", "10",
                                adjuster::testing::kInitialTime, "Submitted") +
                "]");
}

TEST(claim_text, listing_orders_ids_past_one_byte_numerically) {
  auto fixture = adjuster::testing::registry_fixture{"adjuster_text_many"};
  auto& registry = fixture.registry();
  for (auto i = 0; i < 300; ++i) {
    ASSERT_TRUE(
        registry.submit_claim(kCaller, (i % 2 == 0) ? "EVEN" : "ODD", i + 1).ok());
  }

  auto even = nlohmann::json::parse(registry.list_customer_claims_as_text("EVEN"));
  ASSERT_EQ(even.size(), 150u);
  auto previous = uint64_t{0};
  for (const auto& claim : even) {
    auto claim_id = claim["claimId"].get<uint64_t>();
    EXPECT_GT(claim_id, previous);
    EXPECT_EQ(claim_id % 2, 1u);
    previous = claim_id;
  }
}

TEST(claim_text, event_records_render_with_type_discriminator) {
  auto record = adjuster::schema::claim_event_record_t{
      .event_id = 4,
      .recorded_at = 99,
      .event = adjuster::schema::ownership_transferred_t{
          .previous_owner = kOwner, .new_owner = std::nullopt}};
  auto object = adjuster::registry::to_json(record);
  EXPECT_EQ(object["eventId"], "4");
  EXPECT_EQ(object["type"], "OwnershipTransferred");
  EXPECT_EQ(object["previousOwner"],
            adjuster::schema::to_prefixed_hex(adjuster::schema::bytes_view_t{kOwner}));
  EXPECT_TRUE(object["newOwner"].is_null());
}
