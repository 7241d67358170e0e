#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct raise_dispute;

template <>
struct raise_dispute<1> final {
  uint16_t version{1};
  uint64_t escrow_id{};
};

using raise_dispute_t = raise_dispute<1>;

}  // namespace covenant::schema
