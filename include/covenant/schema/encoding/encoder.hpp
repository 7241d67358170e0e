#pragma once
#include <covenant/schema/primitives.hpp>
#include <optional>
#include <span>

namespace covenant::schema::encoding {

// Encoder selection is a build time setting: every integration point names
// the library through a tag type, e.g. encoder<scale_encoder_tag>.
template <typename Library>
struct encoder {
  template <typename T>
  covenant::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, covenant::schema::bytes_t& out);

  template <typename T>
  T decode(const covenant::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const covenant::schema::bytes_view_t& bytes);
};

}  // namespace covenant::schema::encoding
