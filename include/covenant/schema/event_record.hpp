#pragma once

#include <covenant/schema/primitives.hpp>
#include <covenant/schema/transaction_event.hpp>
#include <cstdint>

// Schema type: event record.
// Settlement workflow: Append-only audit feed entry. Engine logic never reads
// these back.
namespace covenant::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  int64_t height{};
  uint32_t tx_index{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace covenant::schema
