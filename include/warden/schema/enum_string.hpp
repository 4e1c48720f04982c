#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for the schema enums. Records carry these enums as raw
// uint32_t, so a table also resolves raw wire values.
namespace warden::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// nullopt when `raw` is not one of the tabled values.
template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_wire(
    const uint32_t raw,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& mapping : mappings) {
    if (static_cast<uint32_t>(mapping.second) == raw) {
      return mapping.second;
    }
  }
  return std::nullopt;
}

// Specialized beside each enum's table.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

template <typename Enum>
std::optional<Enum> try_from_wire(uint32_t raw);

}  // namespace warden::schema
