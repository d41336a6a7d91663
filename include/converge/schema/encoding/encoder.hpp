#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace converge::schema::encoding {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

/// Build-time selected binary codec for persisted state. Specialized per
/// library tag; `scale_encoder_tag` is the only one.
template <typename Library>
struct encoder {
  template <typename T>
  bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const bytes_view_t& bytes);
};

}  // namespace converge::schema::encoding
