#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: escrow status.
// Settlement workflow: Escrow lifecycle enum. Released, refunded and resolved
// are terminal.
namespace covenant::schema {

enum class escrow_status_t : uint8_t {
  created = 0,
  funded = 1,
  released = 2,
  refunded = 3,
  disputed = 4,
  resolved = 5
};

inline constexpr auto kEscrowStatusMappings = std::array{
    enum_mapping<escrow_status_t>{"created", escrow_status_t::created},
    enum_mapping<escrow_status_t>{"funded", escrow_status_t::funded},
    enum_mapping<escrow_status_t>{"released", escrow_status_t::released},
    enum_mapping<escrow_status_t>{"refunded", escrow_status_t::refunded},
    enum_mapping<escrow_status_t>{"disputed", escrow_status_t::disputed},
    enum_mapping<escrow_status_t>{"resolved", escrow_status_t::resolved}};

template <>
inline std::optional<escrow_status_t> try_from_string<escrow_status_t>(
    const std::string_view value) {
  return from_string(value, kEscrowStatusMappings);
}

inline constexpr std::string_view to_string(const escrow_status_t value) {
  return enum_name(value, kEscrowStatusMappings);
}

inline constexpr bool is_terminal(const escrow_status_t value) {
  return value == escrow_status_t::released ||
         value == escrow_status_t::refunded ||
         value == escrow_status_t::resolved;
}

}  // namespace covenant::schema
