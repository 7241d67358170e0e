#pragma once
#include <covenant/schema/primitives.hpp>

// Schema type: resolve dispute.
// Settlement workflow: Arbiter awards a disputed escrow to the buyer or the
// seller, less the platform fee.
namespace covenant::schema {

template <uint16_t Version>
struct resolve_dispute;

template <>
struct resolve_dispute<1> final {
  uint16_t version{1};
  uint64_t escrow_id{};
  account_id_t recipient{};
};

using resolve_dispute_t = resolve_dispute<1>;

}  // namespace covenant::schema
