#pragma once
#include <covenant/schema/primitives.hpp>
#include <vector>

// Schema type: register voters batch.
// Governance workflow: Best effort registration; null and duplicate entries
// are skipped.
namespace covenant::schema {

template <uint16_t Version>
struct register_voters_batch;

template <>
struct register_voters_batch<1> final {
  uint16_t version{1};
  std::vector<account_id_t> voters;
};

using register_voters_batch_t = register_voters_batch<1>;

}  // namespace covenant::schema
