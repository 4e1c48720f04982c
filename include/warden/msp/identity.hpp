#pragma once

#include <warden/crypto/certificate.hpp>
#include <warden/crypto/provider.hpp>
#include <warden/schema/msp_principal.hpp>
#include <warden/schema/msp_result.hpp>
#include <warden/schema/primitives.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::msp {

class trust_store;

struct identity_identifier final {
  std::string msp_id;
  std::string id;

  bool operator==(const identity_identifier&) const = default;
};

// Local id assigned by the default derivation strategy. No per-identity id
// is derived from certificate content yet, so every identity of a store
// shares this value.
inline constexpr auto kDefaultLocalIdentifier = std::string_view{"DEFAULT"};

/// Strategy producing the local part of an identity identifier.
using identifier_deriver_t =
    std::function<std::string(const warden::crypto::certificate&)>;

identifier_deriver_t default_identifier_deriver();

/// Authenticated principal backed by a certificate and its public key.
///
/// x509_identity (and signing_identity) are the only implementations; other
/// credential schemes plug in here rather than by inspecting concrete types.
class identity {
 public:
  virtual ~identity() = default;

  virtual const identity_identifier& identifier() const = 0;
  virtual const std::string& msp_identifier() const = 0;
  virtual const warden::crypto::certificate& certificate() const = 0;
  virtual const std::shared_ptr<const warden::crypto::key>& public_key()
      const = 0;
  virtual const std::vector<std::string>& organizational_units() const = 0;

  /// Encoded serialized_identity<1> carrying the PEM certificate.
  virtual warden::schema::bytes_t serialize() const = 0;

  virtual warden::schema::msp_result_t verify(
      const warden::schema::bytes_view_t& message,
      const warden::schema::bytes_view_t& signature) const = 0;

  /// Validate against the owning store. Fails with `uninitialized` once the
  /// store is gone.
  virtual warden::schema::msp_result_t validate() const = 0;

  virtual warden::schema::msp_result_t satisfies_principal(
      const warden::schema::msp_principal_t& principal) const = 0;
};

class x509_identity : public identity {
 public:
  x509_identity(identity_identifier identifier,
                warden::crypto::certificate certificate,
                std::shared_ptr<const warden::crypto::key> public_key,
                std::shared_ptr<const warden::crypto::provider> provider,
                std::weak_ptr<const trust_store> store);

  const identity_identifier& identifier() const override;
  const std::string& msp_identifier() const override;
  const warden::crypto::certificate& certificate() const override;
  const std::shared_ptr<const warden::crypto::key>& public_key()
      const override;
  const std::vector<std::string>& organizational_units() const override;
  warden::schema::bytes_t serialize() const override;
  warden::schema::msp_result_t verify(
      const warden::schema::bytes_view_t& message,
      const warden::schema::bytes_view_t& signature) const override;
  warden::schema::msp_result_t validate() const override;
  warden::schema::msp_result_t satisfies_principal(
      const warden::schema::msp_principal_t& principal) const override;

 protected:
  const std::shared_ptr<const warden::crypto::provider>& provider() const {
    return provider_;
  }
  const std::weak_ptr<const trust_store>& store() const { return store_; }

 private:
  identity_identifier identifier_;
  warden::crypto::certificate certificate_;
  std::shared_ptr<const warden::crypto::key> public_key_;
  std::shared_ptr<const warden::crypto::provider> provider_;
  std::weak_ptr<const trust_store> store_;
};

/// Identity able to sign. The signer's public key is checked against the
/// certificate once, by trust_store setup, before construction.
class signing_identity final : public x509_identity {
 public:
  signing_identity(identity_identifier identifier,
                   warden::crypto::certificate certificate,
                   std::shared_ptr<const warden::crypto::key> public_key,
                   std::shared_ptr<const warden::crypto::signer> signer,
                   std::shared_ptr<const warden::crypto::provider> provider,
                   std::weak_ptr<const trust_store> store);

  std::optional<warden::schema::bytes_t> sign(
      const warden::schema::bytes_view_t& message,
      warden::schema::msp_result_t& result) const;

  /// The same identity without signing capability.
  std::shared_ptr<const identity> public_version() const;

 private:
  std::shared_ptr<const warden::crypto::signer> signer_;
};

}  // namespace warden::msp
