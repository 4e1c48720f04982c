#pragma once

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <array>
#include <memory>
#include <string>

namespace warden::crypto {

using bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free_all)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using x509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using x509_store_ptr = std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)>;
using x509_store_ctx_ptr =
    std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)>;

struct x509_stack_deleter final {
  void operator()(STACK_OF(X509) * stack) const {
    sk_X509_pop_free(stack, X509_free);
  }
};
using x509_stack_ptr = std::unique_ptr<STACK_OF(X509), x509_stack_deleter>;

/// Pop and format the calling thread's OpenSSL error queue. Returns
/// `fallback` when the queue is empty.
inline std::string drain_openssl_errors(const std::string& fallback) {
  auto out = std::string{};
  auto buffer = std::array<char, 256>{};
  for (auto code = ERR_get_error(); code != 0; code = ERR_get_error()) {
    ERR_error_string_n(code, buffer.data(), buffer.size());
    if (!out.empty()) {
      out += "; ";
    }
    out += buffer.data();
  }
  return out.empty() ? fallback : out;
}

}  // namespace warden::crypto
