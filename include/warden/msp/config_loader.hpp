#pragma once

#include <warden/schema/msp_config.hpp>
#include <warden/schema/msp_result.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace warden::msp {

/// Build an x509 configuration from an MSP directory:
///
///   cacerts/            root certificates (required, non-empty)
///   intermediatecerts/  intermediate certificates
///   admincerts/         admin certificates
///   signcerts/          signing certificate (first file by name)
///   keystore/           its private key (first file by name)
///
/// Every regular file is one PEM entry. Fails with `config_error`.
std::optional<warden::schema::x509_msp_config_t> load_x509_msp_config(
    const std::filesystem::path& dir,
    std::string_view msp_id,
    warden::schema::msp_result_t& result);

warden::schema::msp_config_t make_msp_config(
    const warden::schema::x509_msp_config_t& config);

}  // namespace warden::msp
