#pragma once
#include <converge/common/critical.hpp>
#include <converge/schema/encoding/encoder.hpp>
#include <converge/schema/encoding/scale/default_action.hpp>
#include <scale/scale.hpp>

namespace converge::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const bytes_view_t& bytes);
};

template <typename T>
bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    converge::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace converge::schema::encoding
