#pragma once

#include <covenant/schema/primitives.hpp>
#include <covenant/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Settlement workflow: Finalize output: per-transaction results plus the
// candidate post-block state root.
namespace covenant::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root{};
};

using block_result_t = block_result<1>;

}  // namespace covenant::schema
