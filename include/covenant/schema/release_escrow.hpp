#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct release_escrow;

template <>
struct release_escrow<1> final {
  uint16_t version{1};
  uint64_t escrow_id{};
};

using release_escrow_t = release_escrow<1>;

}  // namespace covenant::schema
