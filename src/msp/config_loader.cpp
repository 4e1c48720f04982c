#include <warden/msp/config_loader.hpp>
#include <warden/msp/status.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using warden::schema::msp_error_code;

namespace warden::msp {

namespace {

bool read_file(const std::filesystem::path& path,
               warden::schema::bytes_t& out,
               warden::schema::msp_result_t& result) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    result = make_error(msp_error_code::config_error, "could not read file",
                        path.string(), kConfigCodespace);
    return false;
  }
  out = warden::schema::bytes_t{std::istreambuf_iterator<char>{input},
                                std::istreambuf_iterator<char>{}};
  if (out.empty()) {
    result = make_error(msp_error_code::config_error, "file is empty",
                        path.string(), kConfigCodespace);
    return false;
  }
  return true;
}

// Regular files of `dir` sorted by name. A missing directory yields an
// empty list.
bool list_files(const std::filesystem::path& dir,
                std::vector<std::filesystem::path>& out,
                warden::schema::msp_result_t& result) {
  auto ec = std::error_code{};
  if (!std::filesystem::is_directory(dir, ec)) {
    return true;
  }
  auto it = std::filesystem::directory_iterator{dir, ec};
  if (ec) {
    result = make_error(msp_error_code::config_error,
                        "could not list directory",
                        dir.string() + ": " + ec.message(), kConfigCodespace);
    return false;
  }
  for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
    if (ec) {
      break;
    }
    auto entry_ec = std::error_code{};
    if (it->is_regular_file(entry_ec)) {
      out.push_back(it->path());
    }
  }
  if (ec) {
    result = make_error(msp_error_code::config_error,
                        "could not list directory",
                        dir.string() + ": " + ec.message(), kConfigCodespace);
    return false;
  }
  std::sort(std::begin(out), std::end(out));
  return true;
}

bool read_dir(const std::filesystem::path& dir,
              std::vector<warden::schema::bytes_t>& out,
              warden::schema::msp_result_t& result) {
  auto files = std::vector<std::filesystem::path>{};
  if (!list_files(dir, files, result)) {
    return false;
  }
  for (const auto& file : files) {
    auto bytes = warden::schema::bytes_t{};
    if (!read_file(file, bytes, result)) {
      return false;
    }
    out.push_back(std::move(bytes));
  }
  return true;
}

}  // namespace

std::optional<warden::schema::x509_msp_config_t> load_x509_msp_config(
    const std::filesystem::path& dir,
    const std::string_view msp_id,
    warden::schema::msp_result_t& result) {
  spdlog::debug("Loading MSP {} from '{}'", msp_id, dir.string());

  auto config = warden::schema::x509_msp_config_t{};
  config.name = std::string{msp_id};

  auto ec = std::error_code{};
  if (!std::filesystem::is_directory(dir / "cacerts", ec)) {
    result = make_error(msp_error_code::config_error,
                        "missing cacerts directory",
                        ec ? dir.string() + ": " + ec.message() : dir.string(),
                        kConfigCodespace);
    return std::nullopt;
  }
  if (!read_dir(dir / "cacerts", config.root_certs, result) ||
      !read_dir(dir / "intermediatecerts", config.intermediate_certs,
                result) ||
      !read_dir(dir / "admincerts", config.admins, result)) {
    return std::nullopt;
  }
  if (config.root_certs.empty()) {
    result = make_error(msp_error_code::config_error,
                        "cacerts directory holds no certificate",
                        dir.string(), kConfigCodespace);
    return std::nullopt;
  }

  auto sign_files = std::vector<std::filesystem::path>{};
  if (!list_files(dir / "signcerts", sign_files, result)) {
    return std::nullopt;
  }
  if (!sign_files.empty()) {
    auto key_files = std::vector<std::filesystem::path>{};
    if (!list_files(dir / "keystore", key_files, result)) {
      return std::nullopt;
    }
    if (key_files.empty()) {
      result = make_error(msp_error_code::config_error,
                          "signing certificate has no private key",
                          (dir / "keystore").string(), kConfigCodespace);
      return std::nullopt;
    }
    auto info = warden::schema::signing_identity_info_t{};
    if (!read_file(sign_files.front(), info.public_signer, result) ||
        !read_file(key_files.front(), info.private_signer.key_material,
                   result)) {
      return std::nullopt;
    }
    info.private_signer.key_identifier =
        key_files.front().filename().string();
    config.signing_identity = std::move(info);
  }

  spdlog::info("Loaded MSP {} from '{}': {} root(s), {} intermediate(s)",
               msp_id, dir.string(), config.root_certs.size(),
               config.intermediate_certs.size());
  result = make_ok();
  return config;
}

warden::schema::msp_config_t make_msp_config(
    const warden::schema::x509_msp_config_t& config) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto envelope = warden::schema::msp_config_t{};
  envelope.type = static_cast<uint32_t>(warden::schema::provider_type_t::x509);
  envelope.config = encoder.encode(config);
  return envelope;
}

}  // namespace warden::msp
