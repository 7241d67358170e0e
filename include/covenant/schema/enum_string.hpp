#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace covenant::schema {

template <typename Enum>
using enum_mapping = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_mapping<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view enum_name(
    const Enum value,
    const std::array<enum_mapping<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return "unknown";
}

// Specialized beside each enum's name table.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace covenant::schema
