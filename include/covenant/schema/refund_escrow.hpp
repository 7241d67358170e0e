#pragma once
#include <covenant/schema/primitives.hpp>

namespace covenant::schema {

template <uint16_t Version>
struct refund_escrow;

template <>
struct refund_escrow<1> final {
  uint16_t version{1};
  uint64_t escrow_id{};
};

using refund_escrow_t = refund_escrow<1>;

}  // namespace covenant::schema
