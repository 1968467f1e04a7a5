#include <adjuster/schema/key/builder.hpp>
#include <adjuster/schema/key/registry_keys.hpp>

#include <boost/endian/conversion.hpp>
#include <cstring>

namespace adjuster::schema::key {

bytes_t make_claim_key(const claim_id_t claim_id) {
  auto b = builder{};
  b.write(kClaimPrefix);
  b.write(claim_id);
  return b.data;
}

bytes_t make_customer_index_prefix(const hash32_t& customer_id_hash) {
  auto b = builder{};
  b.write(kCustomerIndexPrefix);
  b.write(std::span(customer_id_hash.data(), customer_id_hash.size()));
  b.write("|");
  return b.data;
}

bytes_t make_customer_index_key(const hash32_t& customer_id_hash,
                                const claim_id_t claim_id) {
  auto b = builder{make_customer_index_prefix(customer_id_hash)};
  b.write(claim_id);
  return b.data;
}

bytes_t make_event_key(const event_id_t event_id) {
  auto b = builder{};
  b.write(kEventPrefix);
  b.write(event_id);
  return b.data;
}

bytes_t make_system_key(const std::string_view name) {
  return make_bytes(name);
}

std::optional<uint64_t> try_parse_trailing_id(const bytes_view_t& key) {
  if (key.size() < sizeof(uint64_t)) {
    return std::nullopt;
  }
  auto big = uint64_t{};
  std::memcpy(&big, key.data() + key.size() - sizeof(uint64_t),
              sizeof(uint64_t));
  return boost::endian::big_to_native(big);
}

}  // namespace adjuster::schema::key
