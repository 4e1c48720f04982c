#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: MSP role.
// Payload of a role principal: the provider the role is scoped to and the
// role an identity must hold there.
namespace warden::schema {

enum class msp_role_type_t : uint32_t { member = 0, admin = 1 };

inline constexpr auto kMspRoleTypeMappings = std::array{
    std::pair<std::string_view, msp_role_type_t>{"member",
                                                 msp_role_type_t::member},
    std::pair<std::string_view, msp_role_type_t>{"admin",
                                                 msp_role_type_t::admin},
};

template <>
inline std::optional<msp_role_type_t> try_from_string<msp_role_type_t>(
    const std::string_view value) {
  return from_string(value, kMspRoleTypeMappings);
}

template <>
inline std::optional<msp_role_type_t>
try_from_wire<msp_role_type_t>(const uint32_t raw) {
  return from_wire(raw, kMspRoleTypeMappings);
}

inline constexpr std::string_view to_string(const msp_role_type_t value) {
  return to_string(value, kMspRoleTypeMappings).value_or("unknown");
}

template <uint16_t Version>
struct msp_role;

// `role` holds a raw msp_role_type_t value so that unknown roles reach the
// evaluator instead of failing to decode.
template <>
struct msp_role<1> final {
  uint16_t version{1};
  std::string msp_identifier;
  uint32_t role{static_cast<uint32_t>(msp_role_type_t::member)};
};

using msp_role_t = msp_role<1>;

}  // namespace warden::schema
