#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Error taxonomy shared by every MSP operation. Values are stable: they are
// carried in msp_result<1>::code and printed by the tool.
namespace warden::schema {

enum class msp_error_code : uint32_t {
  ok = 0,
  config_error = 1,
  decode_error = 2,
  parse_error = 3,
  uninitialized = 4,
  ca_used_as_identity = 5,
  chain_verification_failed = 6,
  msp_mismatch = 7,
  domain_mismatch = 8,
  identity_mismatch = 9,
  unknown_role = 10,
  unknown_principal_type = 11,
  not_implemented = 12,
  key_import_failed = 13,
  key_mismatch = 14,
  no_signing_identity = 15,
  signing_failed = 16,
  signature_verification_failed = 17,
  unknown_msp = 18,
};

inline constexpr auto kMspErrorCodeMappings = std::array{
    std::pair<std::string_view, msp_error_code>{"ok", msp_error_code::ok},
    std::pair<std::string_view, msp_error_code>{"config_error",
                                                msp_error_code::config_error},
    std::pair<std::string_view, msp_error_code>{"decode_error",
                                                msp_error_code::decode_error},
    std::pair<std::string_view, msp_error_code>{"parse_error",
                                                msp_error_code::parse_error},
    std::pair<std::string_view, msp_error_code>{
        "uninitialized", msp_error_code::uninitialized},
    std::pair<std::string_view, msp_error_code>{
        "ca_used_as_identity", msp_error_code::ca_used_as_identity},
    std::pair<std::string_view, msp_error_code>{
        "chain_verification_failed",
        msp_error_code::chain_verification_failed},
    std::pair<std::string_view, msp_error_code>{"msp_mismatch",
                                                msp_error_code::msp_mismatch},
    std::pair<std::string_view, msp_error_code>{
        "domain_mismatch", msp_error_code::domain_mismatch},
    std::pair<std::string_view, msp_error_code>{
        "identity_mismatch", msp_error_code::identity_mismatch},
    std::pair<std::string_view, msp_error_code>{"unknown_role",
                                                msp_error_code::unknown_role},
    std::pair<std::string_view, msp_error_code>{
        "unknown_principal_type", msp_error_code::unknown_principal_type},
    std::pair<std::string_view, msp_error_code>{
        "not_implemented", msp_error_code::not_implemented},
    std::pair<std::string_view, msp_error_code>{
        "key_import_failed", msp_error_code::key_import_failed},
    std::pair<std::string_view, msp_error_code>{"key_mismatch",
                                                msp_error_code::key_mismatch},
    std::pair<std::string_view, msp_error_code>{
        "no_signing_identity", msp_error_code::no_signing_identity},
    std::pair<std::string_view, msp_error_code>{
        "signing_failed", msp_error_code::signing_failed},
    std::pair<std::string_view, msp_error_code>{
        "signature_verification_failed",
        msp_error_code::signature_verification_failed},
    std::pair<std::string_view, msp_error_code>{"unknown_msp",
                                                msp_error_code::unknown_msp},
};

template <>
inline std::optional<msp_error_code> try_from_string<msp_error_code>(
    const std::string_view value) {
  return from_string(value, kMspErrorCodeMappings);
}

template <>
inline std::optional<msp_error_code>
try_from_wire<msp_error_code>(const uint32_t raw) {
  return from_wire(raw, kMspErrorCodeMappings);
}

inline constexpr std::string_view to_string(const msp_error_code value) {
  return to_string(value, kMspErrorCodeMappings).value_or("unknown");
}

}  // namespace warden::schema
