#include <warden/msp/principal_evaluator.hpp>
#include <warden/msp/status.hpp>
#include <warden/msp/trust_store.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/serialized_identity.hpp>

#include <spdlog/fmt/fmt.h>

#include <string>
#include <utility>

using warden::schema::msp_error_code;

namespace warden::msp {

trust_store::trust_store(construction_key, trust_store_options options)
    : provider_{std::move(options.provider)},
      logger_{std::move(options.logger)},
      derive_identifier_{std::move(options.derive_identifier)},
      accept_chain_{std::move(options.accept_chain)} {
  if (!logger_) {
    logger_ = spdlog::default_logger();
  }
  if (!derive_identifier_) {
    derive_identifier_ = default_identifier_deriver();
  }
}

std::shared_ptr<const trust_store> trust_store::setup(
    const warden::schema::bytes_view_t& config,
    trust_store_options options,
    warden::schema::msp_result_t& result) {
  if (config.empty()) {
    result = make_error(msp_error_code::config_error,
                        "setup error: nil conf reference", {},
                        kSetupCodespace);
    return nullptr;
  }
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto envelope = encoder.try_decode<warden::schema::msp_config_t>(config);
  if (!envelope) {
    result = make_error(msp_error_code::config_error,
                        "could not decode the MSP configuration", {},
                        kSetupCodespace);
    return nullptr;
  }
  return setup(*envelope, std::move(options), result);
}

std::shared_ptr<const trust_store> trust_store::setup(
    const warden::schema::msp_config_t& config,
    trust_store_options options,
    warden::schema::msp_result_t& result) {
  auto type =
      warden::schema::try_from_wire<warden::schema::provider_type_t>(
          config.type);
  if (type != warden::schema::provider_type_t::x509) {
    result = make_error(msp_error_code::config_error,
                        "unsupported MSP provider type",
                        std::to_string(config.type), kSetupCodespace);
    return nullptr;
  }
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto x509_config =
      encoder.try_decode<warden::schema::x509_msp_config_t>(config.config);
  if (!x509_config) {
    result = make_error(msp_error_code::config_error,
                        "could not decode the x509 MSP configuration", {},
                        kSetupCodespace);
    return nullptr;
  }
  return setup(*x509_config, std::move(options), result);
}

std::shared_ptr<const trust_store> trust_store::setup(
    const warden::schema::x509_msp_config_t& config,
    trust_store_options options,
    warden::schema::msp_result_t& result) {
  if (!options.provider) {
    result = make_error(msp_error_code::config_error,
                        "no crypto provider was supplied", {},
                        kSetupCodespace);
    return nullptr;
  }

  auto store =
      std::make_shared<trust_store>(construction_key{}, std::move(options));
  store->name_ = config.name;
  store->logger_->debug("Setting up MSP instance {}", store->name_);

  if (config.root_certs.empty()) {
    result = make_error(msp_error_code::config_error,
                        "expected at least one CA certificate", config.name,
                        kSetupCodespace);
    return nullptr;
  }

  if (!store->load_identities(config.root_certs, "root CA certificate",
                              store->root_certs_, result) ||
      !store->load_identities(config.intermediate_certs,
                              "intermediate certificate",
                              store->intermediate_certs_, result) ||
      !store->load_identities(config.admins, "admin certificate",
                              store->admins_, result)) {
    store->logger_->warn("MSP {} setup failed: {}", config.name,
                         describe(result));
    return nullptr;
  }

  if (config.signing_identity) {
    store->signer_ =
        store->signing_identity_from_config(*config.signing_identity, result);
    if (!store->signer_) {
      store->logger_->warn("MSP {} setup failed: {}", config.name,
                           describe(result));
      return nullptr;
    }
  }

  auto verification = verification_options{};
  for (const auto& root : store->root_certs_) {
    verification.roots.push_back(root->certificate());
  }
  for (const auto& intermediate : store->intermediate_certs_) {
    verification.intermediates.push_back(intermediate->certificate());
  }
  store->verification_options_ = std::move(verification);

  store->logger_->info(
      "MSP {} ready with {} root(s), {} intermediate(s), {} admin(s)",
      store->name_, store->root_certs_.size(),
      store->intermediate_certs_.size(), store->admins_.size());
  result = make_ok();
  return store;
}

bool trust_store::load_identities(
    const std::vector<warden::schema::bytes_t>& blobs,
    const std::string_view kind,
    std::vector<std::shared_ptr<const identity>>& out,
    warden::schema::msp_result_t& result) const {
  out.reserve(blobs.size());
  for (auto i = size_t{0}; i < blobs.size(); ++i) {
    auto id = identity_from_pem(warden::schema::make_bytes_view(blobs[i]),
                                kSetupCodespace, result);
    if (!id) {
      result.log = fmt::format("{} {}: {}", kind, i, result.log);
      return false;
    }
    out.push_back(std::move(id));
  }
  return true;
}

std::shared_ptr<const x509_identity> trust_store::identity_from_pem(
    const warden::schema::bytes_view_t& pem,
    const std::string_view codespace,
    warden::schema::msp_result_t& result) const {
  auto error = warden::crypto::certificate_error::none;
  auto detail = std::string{};
  auto cert = warden::crypto::certificate::from_pem(pem, error, detail);
  if (!cert) {
    if (error == warden::crypto::certificate_error::not_pem) {
      result = make_error(msp_error_code::decode_error,
                          "could not decode pem bytes", detail, codespace);
    } else {
      result = make_error(msp_error_code::parse_error,
                          "could not parse certificate", detail, codespace);
    }
    return nullptr;
  }

  auto key = provider_->import_public_key(*cert, detail);
  if (!key) {
    result = make_error(msp_error_code::key_import_failed,
                        "failed importing key with opts", detail, codespace);
    return nullptr;
  }

  auto identifier = identity_identifier{.msp_id = name_,
                                        .id = derive_identifier_(*cert)};
  result = make_ok();
  return std::make_shared<const x509_identity>(
      std::move(identifier), std::move(*cert), std::move(key), provider_,
      weak_from_this());
}

std::shared_ptr<const signing_identity> trust_store::signing_identity_from_config(
    const warden::schema::signing_identity_info_t& info,
    warden::schema::msp_result_t& result) const {
  auto public_identity = identity_from_pem(
      warden::schema::make_bytes_view(info.public_signer), kSetupCodespace,
      result);
  if (!public_identity) {
    result.log = "signing certificate: " + result.log;
    return nullptr;
  }

  auto error = std::string{};
  auto private_key = provider_->import_private_key(
      warden::schema::make_bytes_view(info.private_signer.key_material),
      error);
  if (!private_key) {
    result = make_error(msp_error_code::decode_error,
                        "could not import the signing key", error,
                        kSetupCodespace);
    return nullptr;
  }

  auto signer = provider_->bind_signer(private_key, error);
  if (!signer) {
    result = make_error(msp_error_code::key_import_failed,
                        "could not bind a signer to the signing key", error,
                        kSetupCodespace);
    return nullptr;
  }

  if (signer->public_key()->public_key_der() !=
      public_identity->public_key()->public_key_der()) {
    result = make_error(msp_error_code::key_mismatch,
                        "the signing key does not match the signing certificate",
                        public_identity->certificate().subject(),
                        kSetupCodespace);
    return nullptr;
  }

  logger_->debug("MSP {} signing identity: {}", name_,
                 public_identity->certificate().subject());
  result = make_ok();
  return std::make_shared<const signing_identity>(
      public_identity->identifier(), public_identity->certificate(),
      public_identity->public_key(), std::move(signer), provider_,
      weak_from_this());
}

std::shared_ptr<const signing_identity> trust_store::default_signing_identity(
    warden::schema::msp_result_t& result) const {
  if (!signer_) {
    result = make_error(msp_error_code::no_signing_identity,
                        "this MSP does not possess a valid default signing "
                        "identity",
                        name_, kSetupCodespace);
    return nullptr;
  }
  result = make_ok();
  return signer_;
}

std::shared_ptr<const identity> trust_store::deserialize_identity(
    const warden::schema::bytes_view_t& serialized,
    warden::schema::msp_result_t& result) const {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<warden::schema::serialized_identity_t>(serialized);
  if (!decoded) {
    result = make_error(msp_error_code::decode_error,
                        "could not deserialize a SerializedIdentity", {},
                        kDeserializeCodespace);
    return nullptr;
  }
  if (decoded->msp_id != name_) {
    result = make_error(
        msp_error_code::msp_mismatch,
        fmt::format("expected MSP ID {}, received {}", name_, decoded->msp_id),
        {}, kDeserializeCodespace);
    return nullptr;
  }
  return identity_from_pem(warden::schema::make_bytes_view(decoded->id_bytes),
                           kDeserializeCodespace, result);
}

warden::schema::msp_result_t trust_store::validate(const identity& id) const {
  if (!verification_options_) {
    return make_error(msp_error_code::uninitialized,
                      "the supplied identity is not valid",
                      "verification options not set", kValidateCodespace);
  }
  logger_->debug("MSP {} validating identity", name_);

  const auto& cert = id.certificate();
  if (cert.is_ca()) {
    return make_error(msp_error_code::ca_used_as_identity,
                      "the supplied identity is not valid",
                      "a CA certificate cannot be used directly by this MSP",
                      kValidateCodespace);
  }

  auto chain = std::vector<warden::crypto::certificate>{};
  auto reason = std::string{};
  if (!provider_->verify_chain(cert, verification_options_->roots,
                               verification_options_->intermediates, chain,
                               reason)) {
    logger_->debug("MSP {} rejected {}: {}", name_, cert.subject(), reason);
    return make_error(msp_error_code::chain_verification_failed,
                      "the supplied identity is not valid", reason,
                      kValidateCodespace);
  }

  if (accept_chain_ && !accept_chain_(chain)) {
    return make_error(msp_error_code::chain_verification_failed,
                      "the supplied identity is not valid",
                      "certification path rejected by acceptance policy",
                      kValidateCodespace);
  }
  return make_ok();
}

warden::schema::msp_result_t trust_store::satisfies_principal(
    const identity& id,
    const warden::schema::msp_principal_t& principal) const {
  return warden::msp::satisfies_principal(*this, id, principal);
}

}  // namespace warden::msp
