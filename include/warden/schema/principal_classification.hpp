#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: principal classification.
// Selects how the payload of an msp_principal is interpreted.
namespace warden::schema {

enum class principal_classification_t : uint32_t {
  role = 0,
  identity = 1,
  organization_unit = 2
};

inline constexpr auto kPrincipalClassificationMappings = std::array{
    std::pair<std::string_view, principal_classification_t>{
        "role", principal_classification_t::role},
    std::pair<std::string_view, principal_classification_t>{
        "identity", principal_classification_t::identity},
    std::pair<std::string_view, principal_classification_t>{
        "organization_unit", principal_classification_t::organization_unit},
};

template <>
inline std::optional<principal_classification_t>
try_from_string<principal_classification_t>(const std::string_view value) {
  return from_string(value, kPrincipalClassificationMappings);
}

template <>
inline std::optional<principal_classification_t>
try_from_wire<principal_classification_t>(const uint32_t raw) {
  return from_wire(raw, kPrincipalClassificationMappings);
}

inline constexpr std::string_view to_string(
    const principal_classification_t value) {
  return to_string(value, kPrincipalClassificationMappings)
      .value_or("unknown");
}

}  // namespace warden::schema
