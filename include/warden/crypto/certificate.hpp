#pragma once

#include <warden/schema/primitives.hpp>

#include <openssl/x509.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden::crypto {

enum class certificate_error : uint8_t {
  none = 0,
  // Input absent or not a PEM block.
  not_pem = 1,
  // PEM block found but its payload is not a well-formed X.509 certificate.
  malformed = 2
};

/// Immutable, parsed X.509 certificate.
///
/// Copies share the underlying OpenSSL object; nothing mutates it after
/// parsing, so instances may be read from any thread.
class certificate final {
 public:
  /// Parse the first PEM block of `pem`. The block label is not checked.
  static std::optional<certificate> from_pem(
      const warden::schema::bytes_view_t& pem,
      certificate_error& error,
      std::string& detail);

  /// Parse a DER certificate. Trailing bytes are rejected.
  static std::optional<certificate> from_der(
      const warden::schema::bytes_view_t& der,
      std::string& detail);

  const warden::schema::bytes_t& der() const { return der_; }

  /// PEM encoding ("CERTIFICATE" block) of der().
  warden::schema::bytes_t pem() const;

  /// basicConstraints cA flag.
  bool is_ca() const { return is_ca_; }

  const std::string& subject() const { return subject_; }
  const std::string& issuer() const { return issuer_; }

  /// OU attribute values of the subject name, in order of appearance.
  const std::vector<std::string>& organizational_units() const {
    return organizational_units_;
  }

  X509* native() const { return x509_.get(); }

  bool operator==(const certificate& other) const {
    return der_ == other.der_;
  }

 private:
  certificate() = default;

  std::shared_ptr<X509> x509_;
  warden::schema::bytes_t der_;
  bool is_ca_{false};
  std::string subject_;
  std::string issuer_;
  std::vector<std::string> organizational_units_;
};

}  // namespace warden::crypto
