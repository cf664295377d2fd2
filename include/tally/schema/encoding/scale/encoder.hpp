#pragma once
#include <tally/common/critical.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <tally/schema/encoding/scale/asset_state.hpp>
#include <tally/schema/encoding/scale/feature_state.hpp>
#include <scale/scale.hpp>

namespace tally::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);
};

template <typename T>
tally::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    tally::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const tally::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    // A stored record that no longer decodes means the ledger is corrupt.
    tally::common::critical("failed to decode ledger record");
  }
  return decoded.value();
}

}  // namespace tally::schema::encoding

namespace tally {

using scale_encoder_t =
    tally::schema::encoding::encoder<tally::schema::encoding::scale_encoder_tag>;

}  // namespace tally
