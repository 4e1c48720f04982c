#include <warden/msp/identity.hpp>
#include <warden/msp/principal_evaluator.hpp>
#include <warden/msp/status.hpp>
#include <warden/msp/trust_store.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/serialized_identity.hpp>

#include <utility>

using warden::schema::msp_error_code;

namespace warden::msp {

identifier_deriver_t default_identifier_deriver() {
  return [](const warden::crypto::certificate&) {
    return std::string{kDefaultLocalIdentifier};
  };
}

x509_identity::x509_identity(
    identity_identifier identifier,
    warden::crypto::certificate certificate,
    std::shared_ptr<const warden::crypto::key> public_key,
    std::shared_ptr<const warden::crypto::provider> provider,
    std::weak_ptr<const trust_store> store)
    : identifier_{std::move(identifier)},
      certificate_{std::move(certificate)},
      public_key_{std::move(public_key)},
      provider_{std::move(provider)},
      store_{std::move(store)} {}

const identity_identifier& x509_identity::identifier() const {
  return identifier_;
}

const std::string& x509_identity::msp_identifier() const {
  return identifier_.msp_id;
}

const warden::crypto::certificate& x509_identity::certificate() const {
  return certificate_;
}

const std::shared_ptr<const warden::crypto::key>& x509_identity::public_key()
    const {
  return public_key_;
}

const std::vector<std::string>& x509_identity::organizational_units() const {
  return certificate_.organizational_units();
}

warden::schema::bytes_t x509_identity::serialize() const {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  return encoder.encode(warden::schema::serialized_identity_t{
      .msp_id = identifier_.msp_id, .id_bytes = certificate_.pem()});
}

warden::schema::msp_result_t x509_identity::verify(
    const warden::schema::bytes_view_t& message,
    const warden::schema::bytes_view_t& signature) const {
  if (!provider_->verify_signature(*public_key_, message, signature)) {
    return make_error(msp_error_code::signature_verification_failed,
                      "the signature is invalid", {}, kSignatureCodespace);
  }
  return make_ok();
}

warden::schema::msp_result_t x509_identity::validate() const {
  auto owner = store_.lock();
  if (!owner) {
    return make_error(msp_error_code::uninitialized,
                      "the owning MSP instance no longer exists", {},
                      kValidateCodespace);
  }
  return owner->validate(*this);
}

warden::schema::msp_result_t x509_identity::satisfies_principal(
    const warden::schema::msp_principal_t& principal) const {
  auto owner = store_.lock();
  if (!owner) {
    return make_error(msp_error_code::uninitialized,
                      "the owning MSP instance no longer exists", {},
                      kPrincipalCodespace);
  }
  return warden::msp::satisfies_principal(*owner, *this, principal);
}

signing_identity::signing_identity(
    identity_identifier identifier,
    warden::crypto::certificate certificate,
    std::shared_ptr<const warden::crypto::key> public_key,
    std::shared_ptr<const warden::crypto::signer> signer,
    std::shared_ptr<const warden::crypto::provider> provider,
    std::weak_ptr<const trust_store> store)
    : x509_identity{std::move(identifier), std::move(certificate),
                    std::move(public_key), std::move(provider),
                    std::move(store)},
      signer_{std::move(signer)} {}

std::optional<warden::schema::bytes_t> signing_identity::sign(
    const warden::schema::bytes_view_t& message,
    warden::schema::msp_result_t& result) const {
  auto error = std::string{};
  auto signature = signer_->sign(message, error);
  if (!signature) {
    result = make_error(msp_error_code::signing_failed,
                        "could not sign the message", error,
                        kSignatureCodespace);
    return std::nullopt;
  }
  result = make_ok();
  return signature;
}

std::shared_ptr<const identity> signing_identity::public_version() const {
  return std::make_shared<const x509_identity>(
      identifier(), certificate(), public_key(), provider(), store());
}

}  // namespace warden::msp
