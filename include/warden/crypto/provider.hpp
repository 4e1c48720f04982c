#pragma once

#include <warden/crypto/certificate.hpp>
#include <warden/schema/primitives.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden::crypto {

/// Opaque key handle issued by a provider.
class key {
 public:
  virtual ~key() = default;

  virtual bool is_private() const = 0;

  /// DER SubjectPublicKeyInfo of the public half. Two handles refer to the
  /// same key pair when these bytes are equal.
  virtual warden::schema::bytes_t public_key_der() const = 0;
};

/// Signing capability bound to a private key.
class signer {
 public:
  virtual ~signer() = default;

  /// Public half of the bound key.
  virtual std::shared_ptr<const key> public_key() const = 0;

  /// Sign `message`; the digest (if any) is chosen by the key type.
  /// Returns std::nullopt and fills `error` on failure.
  virtual std::optional<warden::schema::bytes_t> sign(
      const warden::schema::bytes_view_t& message,
      std::string& error) const = 0;
};

/// Capability surface of the asymmetric crypto backend.
///
/// Implementations must be safe for concurrent use: every call is
/// self-contained and no state is shared between calls.
class provider {
 public:
  virtual ~provider() = default;

  /// Import the subject public key of `cert`. Handles are not persisted.
  virtual std::shared_ptr<const key> import_public_key(
      const certificate& cert,
      std::string& error) const = 0;

  /// Import a private key from PEM or DER key material.
  virtual std::shared_ptr<const key> import_private_key(
      const warden::schema::bytes_view_t& material,
      std::string& error) const = 0;

  /// Bind a signer to a private key handle previously issued by this
  /// provider.
  virtual std::shared_ptr<const signer> bind_signer(
      const std::shared_ptr<const key>& private_key,
      std::string& error) const = 0;

  virtual bool verify_signature(
      const key& public_key,
      const warden::schema::bytes_view_t& message,
      const warden::schema::bytes_view_t& signature) const = 0;

  /// Build and verify a path from `leaf` to one of `anchors`, using
  /// `intermediates` as untrusted chain-building aids.
  ///
  /// On success `chain` holds the accepted path, leaf first. On failure
  /// `reason` describes why no path was found.
  virtual bool verify_chain(const certificate& leaf,
                            const std::vector<certificate>& anchors,
                            const std::vector<certificate>& intermediates,
                            std::vector<certificate>& chain,
                            std::string& reason) const = 0;
};

}  // namespace warden::crypto
