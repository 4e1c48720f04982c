#pragma once

#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: MSP configuration.
// msp_config<1> is the envelope handed to setup; for x509 providers its
// `config` bytes hold an encoded x509_msp_config<1>.
namespace warden::schema {

enum class provider_type_t : uint32_t { x509 = 0 };

inline constexpr auto kProviderTypeMappings = std::array{
    std::pair<std::string_view, provider_type_t>{"x509",
                                                 provider_type_t::x509},
};

template <>
inline std::optional<provider_type_t> try_from_string<provider_type_t>(
    const std::string_view value) {
  return from_string(value, kProviderTypeMappings);
}

template <>
inline std::optional<provider_type_t>
try_from_wire<provider_type_t>(const uint32_t raw) {
  return from_wire(raw, kProviderTypeMappings);
}

inline constexpr std::string_view to_string(const provider_type_t value) {
  return to_string(value, kProviderTypeMappings).value_or("unknown");
}

template <uint16_t Version>
struct key_info;

template <>
struct key_info<1> final {
  uint16_t version{1};
  std::string key_identifier;
  // PEM (PKCS#8 or traditional) or DER private key.
  bytes_t key_material;
};

using key_info_t = key_info<1>;

template <uint16_t Version>
struct signing_identity_info;

template <>
struct signing_identity_info<1> final {
  uint16_t version{1};
  bytes_t public_signer;
  key_info_t private_signer;
};

using signing_identity_info_t = signing_identity_info<1>;

template <uint16_t Version>
struct x509_msp_config;

template <>
struct x509_msp_config<1> final {
  uint16_t version{1};
  std::string name;
  std::vector<bytes_t> root_certs;
  std::vector<bytes_t> intermediate_certs;
  std::vector<bytes_t> admins;
  std::optional<signing_identity_info_t> signing_identity;
};

using x509_msp_config_t = x509_msp_config<1>;

template <uint16_t Version>
struct msp_config;

template <>
struct msp_config<1> final {
  uint16_t version{1};
  uint32_t type{static_cast<uint32_t>(provider_type_t::x509)};
  bytes_t config;
};

using msp_config_t = msp_config<1>;

}  // namespace warden::schema
