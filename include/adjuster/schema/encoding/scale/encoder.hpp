#pragma once
#include <adjuster/common/critical.hpp>
#include <adjuster/schema/claim_event.hpp>
#include <adjuster/schema/claim_state.hpp>
#include <adjuster/schema/encoding/encoder.hpp>
#include <adjuster/schema/encoding/scale/claim_status.hpp>
#include <optional>
#include <scale/scale.hpp>

namespace adjuster::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  adjuster::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const adjuster::schema::bytes_view_t& bytes);
};

template <typename T>
adjuster::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    adjuster::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const adjuster::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace adjuster::schema::encoding
