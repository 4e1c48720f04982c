#pragma once

#include <warden/crypto/certificate.hpp>
#include <warden/crypto/provider.hpp>
#include <warden/msp/identity.hpp>
#include <warden/schema/msp_config.hpp>
#include <warden/schema/msp_principal.hpp>
#include <warden/schema/msp_result.hpp>
#include <warden/schema/primitives.hpp>

#include <spdlog/spdlog.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::msp {

/// Optional policy over an already verified certification path (leaf
/// first). Returning false rejects the identity.
using chain_acceptor_t =
    std::function<bool(const std::vector<warden::crypto::certificate>& chain)>;

/// Collaborators injected into a trust store.
struct trust_store_options final {
  std::shared_ptr<const warden::crypto::provider> provider;
  // spdlog::default_logger() when unset.
  std::shared_ptr<spdlog::logger> logger;
  // default_identifier_deriver() when unset.
  identifier_deriver_t derive_identifier;
  // Any verified path is accepted when unset.
  chain_acceptor_t accept_chain;
};

/// Trust anchors and chain-building aids, computed once per setup.
struct verification_options final {
  std::vector<warden::crypto::certificate> roots;
  std::vector<warden::crypto::certificate> intermediates;
};

/// MSP instance for one membership domain.
///
/// A trust store is only obtainable from setup(), fully built. It is never
/// mutated afterwards, so all const operations may run concurrently without
/// locking. Reconfiguration builds a new instance (see manager).
class trust_store final : public std::enable_shared_from_this<trust_store> {
 private:
  struct construction_key final {
    explicit construction_key() = default;
  };

 public:
  trust_store(construction_key key, trust_store_options options);

  /// Set up from an encoded msp_config<1> envelope. Empty or undecodable
  /// bytes fail with `config_error`.
  static std::shared_ptr<const trust_store> setup(
      const warden::schema::bytes_view_t& config,
      trust_store_options options,
      warden::schema::msp_result_t& result);

  static std::shared_ptr<const trust_store> setup(
      const warden::schema::msp_config_t& config,
      trust_store_options options,
      warden::schema::msp_result_t& result);

  /// Set up from a decoded x509 configuration. Returns nullptr and fills
  /// `result` on any failure; nothing partially built escapes.
  static std::shared_ptr<const trust_store> setup(
      const warden::schema::x509_msp_config_t& config,
      trust_store_options options,
      warden::schema::msp_result_t& result);

  trust_store(const trust_store&) = delete;
  trust_store& operator=(const trust_store&) = delete;

  const std::string& name() const { return name_; }
  warden::schema::provider_type_t type() const {
    return warden::schema::provider_type_t::x509;
  }

  const std::vector<std::shared_ptr<const identity>>& root_certs() const {
    return root_certs_;
  }
  const std::vector<std::shared_ptr<const identity>>& intermediate_certs()
      const {
    return intermediate_certs_;
  }
  const std::vector<std::shared_ptr<const identity>>& admins() const {
    return admins_;
  }

  /// Fails with `no_signing_identity` when none was configured.
  std::shared_ptr<const signing_identity> default_signing_identity(
      warden::schema::msp_result_t& result) const;

  /// Identity from an encoded serialized_identity<1>.
  std::shared_ptr<const identity> deserialize_identity(
      const warden::schema::bytes_view_t& serialized,
      warden::schema::msp_result_t& result) const;

  /// Check that `id` chains to one of this store's roots.
  ///
  /// Any path accepted by the provider (and by the acceptance predicate, if
  /// one is set) is sufficient; no particular path is required.
  warden::schema::msp_result_t validate(const identity& id) const;

  warden::schema::msp_result_t satisfies_principal(
      const identity& id,
      const warden::schema::msp_principal_t& principal) const;

  spdlog::logger& logger() const { return *logger_; }

 private:
  std::shared_ptr<const x509_identity> identity_from_pem(
      const warden::schema::bytes_view_t& pem,
      std::string_view codespace,
      warden::schema::msp_result_t& result) const;

  std::shared_ptr<const signing_identity> signing_identity_from_config(
      const warden::schema::signing_identity_info_t& info,
      warden::schema::msp_result_t& result) const;

  bool load_identities(const std::vector<warden::schema::bytes_t>& blobs,
                       std::string_view kind,
                       std::vector<std::shared_ptr<const identity>>& out,
                       warden::schema::msp_result_t& result) const;

  std::shared_ptr<const warden::crypto::provider> provider_;
  std::shared_ptr<spdlog::logger> logger_;
  identifier_deriver_t derive_identifier_;
  chain_acceptor_t accept_chain_;

  std::string name_;
  std::vector<std::shared_ptr<const identity>> root_certs_;
  std::vector<std::shared_ptr<const identity>> intermediate_certs_;
  std::vector<std::shared_ptr<const identity>> admins_;
  std::shared_ptr<const signing_identity> signer_;
  std::optional<verification_options> verification_options_;
};

}  // namespace warden::msp
