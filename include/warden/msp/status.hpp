#pragma once

#include <warden/schema/msp_error_code.hpp>
#include <warden/schema/msp_result.hpp>

#include <string>
#include <string_view>

namespace warden::msp {

inline constexpr auto kSetupCodespace = std::string_view{"warden.setup"};
inline constexpr auto kValidateCodespace = std::string_view{"warden.validate"};
inline constexpr auto kDeserializeCodespace =
    std::string_view{"warden.deserialize"};
inline constexpr auto kPrincipalCodespace =
    std::string_view{"warden.principal"};
inline constexpr auto kSignatureCodespace =
    std::string_view{"warden.signature"};
inline constexpr auto kManagerCodespace = std::string_view{"warden.manager"};
inline constexpr auto kConfigCodespace = std::string_view{"warden.config"};

warden::schema::msp_result_t make_ok();

warden::schema::msp_result_t make_error(warden::schema::msp_error_code code,
                                        std::string log,
                                        std::string info,
                                        std::string_view codespace);

bool is_ok(const warden::schema::msp_result_t& result);

warden::schema::msp_error_code error_code_of(
    const warden::schema::msp_result_t& result);

/// "<codespace>: <code name> (<code>): <log>[: <info>]", for logs and the
/// tool.
std::string describe(const warden::schema::msp_result_t& result);

}  // namespace warden::msp
