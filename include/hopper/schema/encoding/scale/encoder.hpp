#pragma once
#include <hopper/common/critical.hpp>
#include <hopper/schema/encoding/encoder.hpp>
#include <hopper/schema/transaction_attempt.hpp>
#include <hopper/schema/transfer_message.hpp>
#include <hopper/schema/transfer_plan.hpp>
#include <scale/scale.hpp>

namespace hopper::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  hopper::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const hopper::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const hopper::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
hopper::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    hopper::common::critical("Failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const hopper::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    hopper::common::critical("Failed to decode {} SCALE bytes", bytes.size());
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const hopper::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace hopper::schema::encoding
