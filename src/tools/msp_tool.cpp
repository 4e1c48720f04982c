#include <boost/program_options.hpp>
#include <warden/crypto/certificate.hpp>
#include <warden/crypto/openssl_provider.hpp>
#include <warden/msp/config_loader.hpp>
#include <warden/msp/identity.hpp>
#include <warden/msp/status.hpp>
#include <warden/msp/trust_store.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/msp_principal.hpp>
#include <warden/schema/msp_role.hpp>
#include <warden/schema/serialized_identity.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace {

namespace po = boost::program_options;
using encoder_t = warden::schema::encoding::scale_encoder_t;

constexpr auto kExitOk = 0;
constexpr auto kExitMspError = 1;
constexpr auto kExitUsage = 2;
constexpr auto kToolCodespace = std::string_view{"warden.tool"};

struct usage_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

void print_help(const po::options_description& options) {
  std::cout << "usage: warden_msp_tool "
               "<serialize|validate|satisfies|sign|verify> [options]\n"
            << options << '\n';
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    throw usage_error{"missing required option --" + name};
  }
  return vm[name].as<std::string>();
}

warden::schema::bytes_t read_cert_file(const std::string& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    throw usage_error{"could not read certificate file '" + path + "'"};
  }
  return warden::schema::bytes_t{std::istreambuf_iterator<char>{input},
                                 std::istreambuf_iterator<char>{}};
}

warden::schema::bytes_t require_hex(const po::variables_map& vm,
                                    const std::string& name) {
  auto bytes = warden::schema::try_from_hex(require(vm, name));
  if (!bytes) {
    throw usage_error{"--" + name + " is not valid hex"};
  }
  return *bytes;
}

int report(const warden::schema::msp_result_t& result) {
  if (warden::msp::is_ok(result)) {
    std::cout << "ok\n";
    return kExitOk;
  }
  std::cout << "error " << result.code << '\n';
  std::cerr << warden::msp::describe(result) << '\n';
  return kExitMspError;
}

// Serialized identity carrying the canonical PEM of `--cert`, as produced by
// identity::serialize().
std::optional<warden::schema::bytes_t> serialize_cert(
    const po::variables_map& vm,
    warden::schema::msp_result_t& result) {
  auto pem = read_cert_file(require(vm, "cert"));
  auto error = warden::crypto::certificate_error::none;
  auto detail = std::string{};
  auto cert = warden::crypto::certificate::from_pem(
      warden::schema::make_bytes_view(pem), error, detail);
  if (!cert) {
    result = warden::msp::make_error(
        error == warden::crypto::certificate_error::not_pem
            ? warden::schema::msp_error_code::decode_error
            : warden::schema::msp_error_code::parse_error,
        "could not read --cert", detail, kToolCodespace);
    return std::nullopt;
  }
  return encoder_t{}.encode(warden::schema::serialized_identity_t{
      .msp_id = require(vm, "msp-id"), .id_bytes = cert->pem()});
}

std::shared_ptr<const warden::msp::trust_store> open_store(
    const po::variables_map& vm,
    warden::schema::msp_result_t& result) {
  auto msp_id = require(vm, "msp-id");
  auto config = warden::msp::load_x509_msp_config(require(vm, "msp-dir"),
                                                  msp_id, result);
  if (!config) {
    return nullptr;
  }
  auto options = warden::msp::trust_store_options{};
  options.provider = warden::crypto::make_openssl_provider();
  options.logger = spdlog::default_logger();
  return warden::msp::trust_store::setup(
      warden::msp::make_msp_config(*config), std::move(options), result);
}

std::shared_ptr<const warden::msp::identity> open_identity(
    const po::variables_map& vm,
    const warden::msp::trust_store& store,
    warden::schema::msp_result_t& result) {
  auto serialized = serialize_cert(vm, result);
  if (!serialized) {
    return nullptr;
  }
  return store.deserialize_identity(
      warden::schema::make_bytes_view(*serialized), result);
}

warden::schema::msp_principal_t make_principal(const po::variables_map& vm) {
  if (vm.contains("principal-identity")) {
    return warden::schema::msp_principal_t{
        .classification = static_cast<uint32_t>(
            warden::schema::principal_classification_t::identity),
        .principal = require_hex(vm, "principal-identity")};
  }
  auto role_name = require(vm, "role");
  auto role =
      warden::schema::try_from_string<warden::schema::msp_role_type_t>(
          role_name);
  if (!role) {
    throw usage_error{"--role must be member|admin"};
  }
  auto msp_role = warden::schema::msp_role_t{
      .msp_identifier = require(vm, "msp-id"),
      .role = static_cast<uint32_t>(*role)};
  return warden::schema::msp_principal_t{
      .classification = static_cast<uint32_t>(
          warden::schema::principal_classification_t::role),
      .principal = encoder_t{}.encode(msp_role)};
}

int run(const std::string& command, const po::variables_map& vm) {
  auto result = warden::schema::msp_result_t{};

  if (command == "serialize") {
    auto serialized = serialize_cert(vm, result);
    if (!serialized) {
      return report(result);
    }
    std::cout << warden::schema::to_hex(*serialized) << '\n';
    return kExitOk;
  }

  if (command != "validate" && command != "satisfies" && command != "sign" &&
      command != "verify") {
    throw usage_error{
        "command must be serialize|validate|satisfies|sign|verify"};
  }

  auto store = open_store(vm, result);
  if (!store) {
    return report(result);
  }

  if (command == "sign") {
    auto message = require(vm, "message");
    auto signer = store->default_signing_identity(result);
    if (!signer) {
      return report(result);
    }
    auto signature =
        signer->sign(warden::schema::make_bytes_view(message), result);
    if (!signature) {
      return report(result);
    }
    std::cout << warden::schema::to_hex(*signature) << '\n';
    return kExitOk;
  }

  auto id = open_identity(vm, *store, result);
  if (!id) {
    return report(result);
  }

  if (command == "validate") {
    return report(id->validate());
  }
  if (command == "satisfies") {
    return report(id->satisfies_principal(make_principal(vm)));
  }
  auto message = require(vm, "message");
  auto signature = require_hex(vm, "signature");
  return report(id->verify(warden::schema::make_bytes_view(message),
                           warden::schema::make_bytes_view(signature)));
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"warden_msp_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "serialize|validate|satisfies|sign|verify")(
      "msp-dir", po::value<std::string>(), "MSP directory")(
      "msp-id", po::value<std::string>(), "MSP identifier")(
      "cert", po::value<std::string>(), "PEM certificate file")(
      "role", po::value<std::string>(), "member|admin")(
      "principal-identity", po::value<std::string>(),
      "serialized identity hex")("message", po::value<std::string>(),
                                 "message to sign or verify")(
      "signature", po::value<std::string>(), "signature hex")(
      "verbose,v", "debug logging");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return command.empty() && !vm.contains("help") ? kExitUsage : kExitOk;
  }

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("warden_msp_tool", sink);
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  logger->set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);
  spdlog::set_default_logger(logger);

  try {
    return run(command, vm);
  } catch (const usage_error& e) {
    std::cerr << e.what() << '\n';
    return kExitUsage;
  }
}
