#pragma once

#include <warden/crypto/provider.hpp>

#include <memory>

namespace warden::crypto {

/// OpenSSL 3 backed provider.
///
/// Signatures use SHA-256 for EC and RSA keys and the raw message for
/// Ed25519/Ed448. Chain verification treats every anchor as trusted even
/// when it is not self-signed, and checks validity periods against the
/// current time.
std::shared_ptr<const provider> make_openssl_provider();

}  // namespace warden::crypto
