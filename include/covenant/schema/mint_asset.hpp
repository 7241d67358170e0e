#pragma once
#include <covenant/schema/primitives.hpp>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct mint_asset;

template <>
struct mint_asset<1> final {
  uint16_t version{1};
  std::string uri;
};

using mint_asset_t = mint_asset<1>;

}  // namespace covenant::schema
