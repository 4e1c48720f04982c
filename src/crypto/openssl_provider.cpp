#include <warden/crypto/openssl_provider.hpp>
#include <warden/crypto/openssl_types.hpp>

#include <openssl/pem.h>

#include <limits>
#include <utility>

namespace warden::crypto {

namespace {

int no_passphrase(char*, int, int, void*) {
  return 0;
}

class openssl_key final : public key {
 public:
  openssl_key(std::shared_ptr<EVP_PKEY> pkey, const bool is_private)
      : pkey_{std::move(pkey)}, is_private_{is_private} {}

  bool is_private() const override { return is_private_; }

  warden::schema::bytes_t public_key_der() const override {
    auto length = i2d_PUBKEY(pkey_.get(), nullptr);
    if (length <= 0) {
      ERR_clear_error();
      return {};
    }
    auto out = warden::schema::bytes_t(static_cast<size_t>(length));
    auto* cursor = out.data();
    if (i2d_PUBKEY(pkey_.get(), &cursor) != length) {
      ERR_clear_error();
      return {};
    }
    return out;
  }

  EVP_PKEY* native() const { return pkey_.get(); }
  const std::shared_ptr<EVP_PKEY>& shared() const { return pkey_; }

 private:
  std::shared_ptr<EVP_PKEY> pkey_;
  bool is_private_{false};
};

const EVP_MD* digest_for(EVP_PKEY* pkey) {
  auto id = EVP_PKEY_get_id(pkey);
  if (id == EVP_PKEY_ED25519 || id == EVP_PKEY_ED448) {
    return nullptr;
  }
  return EVP_sha256();
}

class openssl_signer final : public signer {
 public:
  explicit openssl_signer(std::shared_ptr<const openssl_key> private_key)
      : private_key_{std::move(private_key)},
        public_key_{std::make_shared<const openssl_key>(
            private_key_->shared(), false)} {}

  std::shared_ptr<const key> public_key() const override {
    return public_key_;
  }

  std::optional<warden::schema::bytes_t> sign(
      const warden::schema::bytes_view_t& message,
      std::string& error) const override {
    auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (!ctx) {
      error = drain_openssl_errors("could not allocate signing context");
      return std::nullopt;
    }
    auto* pkey = private_key_->native();
    if (EVP_DigestSignInit(ctx.get(), nullptr, digest_for(pkey), nullptr,
                           pkey) != 1) {
      error = drain_openssl_errors("could not initialize signer");
      return std::nullopt;
    }
    auto size = size_t{};
    if (EVP_DigestSign(ctx.get(), nullptr, &size, message.data(),
                       message.size()) != 1) {
      error = drain_openssl_errors("could not size signature");
      return std::nullopt;
    }
    auto signature = warden::schema::bytes_t(size);
    if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                       message.size()) != 1) {
      error = drain_openssl_errors("signing failed");
      return std::nullopt;
    }
    signature.resize(size);
    return signature;
  }

 private:
  std::shared_ptr<const openssl_key> private_key_;
  std::shared_ptr<const openssl_key> public_key_;
};

std::optional<certificate> to_certificate(X509* x509) {
  auto length = i2d_X509(x509, nullptr);
  if (length <= 0) {
    ERR_clear_error();
    return std::nullopt;
  }
  auto der = warden::schema::bytes_t(static_cast<size_t>(length));
  auto* cursor = der.data();
  if (i2d_X509(x509, &cursor) != length) {
    ERR_clear_error();
    return std::nullopt;
  }
  auto detail = std::string{};
  return certificate::from_der(der, detail);
}

class openssl_provider final : public provider {
 public:
  std::shared_ptr<const key> import_public_key(
      const certificate& cert,
      std::string& error) const override {
    auto* pkey = X509_get0_pubkey(cert.native());
    if (pkey == nullptr || EVP_PKEY_up_ref(pkey) != 1) {
      error = drain_openssl_errors("certificate carries no usable public key");
      return nullptr;
    }
    return std::make_shared<const openssl_key>(
        std::shared_ptr<EVP_PKEY>{pkey, EVP_PKEY_free}, false);
  }

  std::shared_ptr<const key> import_private_key(
      const warden::schema::bytes_view_t& material,
      std::string& error) const override {
    if (material.empty() ||
        material.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
      error = "nil or oversized private key material";
      return nullptr;
    }

    auto bio = bio_ptr{
        BIO_new_mem_buf(material.data(), static_cast<int>(material.size())),
        BIO_free_all};
    if (!bio) {
      error = drain_openssl_errors("could not allocate key reader");
      return nullptr;
    }
    auto* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, no_passphrase,
                                        nullptr);
    if (raw == nullptr) {
      ERR_clear_error();
      const auto* cursor = material.data();
      raw = d2i_AutoPrivateKey(nullptr, &cursor,
                               static_cast<long>(material.size()));
    }
    if (raw == nullptr) {
      // Never echo the material itself.
      ERR_clear_error();
      error = "could not decode private key material";
      return nullptr;
    }
    return std::make_shared<const openssl_key>(
        std::shared_ptr<EVP_PKEY>{raw, EVP_PKEY_free}, true);
  }

  std::shared_ptr<const signer> bind_signer(
      const std::shared_ptr<const key>& private_key,
      std::string& error) const override {
    auto native = std::dynamic_pointer_cast<const openssl_key>(private_key);
    if (!native) {
      error = "key handle was not issued by the OpenSSL provider";
      return nullptr;
    }
    if (!native->is_private()) {
      error = "a signer requires a private key";
      return nullptr;
    }
    return std::make_shared<const openssl_signer>(std::move(native));
  }

  bool verify_signature(
      const key& public_key,
      const warden::schema::bytes_view_t& message,
      const warden::schema::bytes_view_t& signature) const override {
    const auto* native = dynamic_cast<const openssl_key*>(&public_key);
    if (native == nullptr || signature.empty()) {
      return false;
    }
    auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (!ctx) {
      ERR_clear_error();
      return false;
    }
    auto ok = false;
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest_for(native->native()),
                             nullptr, native->native()) == 1) {
      ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            message.data(), message.size()) == 1;
    }
    ERR_clear_error();
    return ok;
  }

  bool verify_chain(const certificate& leaf,
                    const std::vector<certificate>& anchors,
                    const std::vector<certificate>& intermediates,
                    std::vector<certificate>& chain,
                    std::string& reason) const override {
    chain.clear();
    auto store = x509_store_ptr{X509_STORE_new(), X509_STORE_free};
    if (!store) {
      reason = drain_openssl_errors("could not allocate trust store");
      return false;
    }
    for (const auto& anchor : anchors) {
      if (X509_STORE_add_cert(store.get(), anchor.native()) != 1) {
        reason = drain_openssl_errors("could not register trust anchor");
        return false;
      }
    }
    // Anchors terminate the path even when they are not self-signed.
    X509_STORE_set_flags(store.get(), X509_V_FLAG_PARTIAL_CHAIN);

    auto untrusted = x509_stack_ptr{sk_X509_new_null()};
    if (!untrusted) {
      reason = drain_openssl_errors("could not allocate intermediate set");
      return false;
    }
    for (const auto& intermediate : intermediates) {
      if (X509_up_ref(intermediate.native()) != 1) {
        reason = drain_openssl_errors("could not reference intermediate");
        return false;
      }
      if (sk_X509_push(untrusted.get(), intermediate.native()) <= 0) {
        X509_free(intermediate.native());
        reason = drain_openssl_errors("could not register intermediate");
        return false;
      }
    }

    auto ctx = x509_store_ctx_ptr{X509_STORE_CTX_new(), X509_STORE_CTX_free};
    if (!ctx || X509_STORE_CTX_init(ctx.get(), store.get(), leaf.native(),
                                    untrusted.get()) != 1) {
      reason = drain_openssl_errors("could not initialize path builder");
      return false;
    }

    if (X509_verify_cert(ctx.get()) != 1) {
      auto code = X509_STORE_CTX_get_error(ctx.get());
      reason = std::string{X509_verify_cert_error_string(code)} +
               " (depth " +
               std::to_string(X509_STORE_CTX_get_error_depth(ctx.get())) + ")";
      ERR_clear_error();
      return false;
    }

    auto path = x509_stack_ptr{X509_STORE_CTX_get1_chain(ctx.get())};
    if (!path) {
      reason = drain_openssl_errors("verified path unavailable");
      return false;
    }
    for (auto i = 0; i < sk_X509_num(path.get()); ++i) {
      auto element = to_certificate(sk_X509_value(path.get(), i));
      if (!element) {
        chain.clear();
        reason = "verified path contains an unencodable certificate";
        return false;
      }
      chain.push_back(std::move(*element));
    }
    return true;
  }
};

}  // namespace

std::shared_ptr<const provider> make_openssl_provider() {
  return std::make_shared<const openssl_provider>();
}

}  // namespace warden::crypto
