#pragma once
#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/encoder.hpp>
#include <covenant/schema/encoding/scale/escrow_status.hpp>
#include <iterator>
#include <optional>
#include <utility>
#include <scale/scale.hpp>
#include <spdlog/spdlog.h>

namespace covenant::schema::encoding {

struct scale_encoder_tag {};

// Schema records are plain aggregates; SCALE encodes them field by field in
// declaration order.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  covenant::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, covenant::schema::bytes_t& out);

  template <typename T>
  T decode(const covenant::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const covenant::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
covenant::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    covenant::common::critical("Failed to encode SCALE object: {}",
                               encoded.error().message());
  }
  return std::move(encoded.value());
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        covenant::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const covenant::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    covenant::common::critical("Failed to decode {} SCALE bytes: {}",
                               bytes.size(), decoded.error().message());
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const covenant::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    spdlog::debug("Rejected {} SCALE bytes: {}", bytes.size(),
                  decoded.error().message());
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace covenant::schema::encoding
