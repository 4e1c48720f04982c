#include <warden/crypto/certificate.hpp>
#include <warden/crypto/openssl_types.hpp>

#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include <limits>

namespace warden::crypto {

namespace {

std::string name_to_string(const X509_NAME* name) {
  auto bio = bio_ptr{BIO_new(BIO_s_mem()), BIO_free_all};
  if (!bio || name == nullptr) {
    return {};
  }
  if (X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0) {
    return {};
  }
  auto* data = static_cast<char*>(nullptr);
  auto size = BIO_get_mem_data(bio.get(), &data);
  if (size <= 0 || data == nullptr) {
    return {};
  }
  return std::string{data, static_cast<size_t>(size)};
}

std::vector<std::string> organizational_units_of(const X509_NAME* name) {
  auto out = std::vector<std::string>{};
  if (name == nullptr) {
    return out;
  }
  auto index = -1;
  while ((index = X509_NAME_get_index_by_NID(
              name, NID_organizationalUnitName, index)) >= 0) {
    const auto* entry = X509_NAME_get_entry(name, index);
    const auto* value = X509_NAME_ENTRY_get_data(entry);
    auto* utf8 = static_cast<unsigned char*>(nullptr);
    auto length = ASN1_STRING_to_UTF8(&utf8, value);
    if (length < 0) {
      continue;
    }
    out.emplace_back(reinterpret_cast<const char*>(utf8),
                     static_cast<size_t>(length));
    OPENSSL_free(utf8);
  }
  return out;
}

}  // namespace

std::optional<certificate> certificate::from_pem(
    const warden::schema::bytes_view_t& pem,
    certificate_error& error,
    std::string& detail) {
  error = certificate_error::none;
  if (pem.empty() ||
      pem.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    error = certificate_error::not_pem;
    detail = "nil or oversized certificate bytes";
    return std::nullopt;
  }

  auto bio = bio_ptr{
      BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free_all};
  if (!bio) {
    error = certificate_error::not_pem;
    detail = drain_openssl_errors("could not allocate PEM reader");
    return std::nullopt;
  }

  auto* name = static_cast<char*>(nullptr);
  auto* header = static_cast<char*>(nullptr);
  auto* data = static_cast<unsigned char*>(nullptr);
  auto length = long{};
  if (PEM_read_bio(bio.get(), &name, &header, &data, &length) != 1) {
    ERR_clear_error();
    error = certificate_error::not_pem;
    detail = "could not decode PEM structure";
    return std::nullopt;
  }
  auto der = warden::schema::bytes_t{data, data + length};
  OPENSSL_free(name);
  OPENSSL_free(header);
  OPENSSL_free(data);

  auto parsed = from_der(der, detail);
  if (!parsed) {
    error = certificate_error::malformed;
  }
  return parsed;
}

std::optional<certificate> certificate::from_der(
    const warden::schema::bytes_view_t& der,
    std::string& detail) {
  if (der.empty() ||
      der.size() > static_cast<size_t>(std::numeric_limits<long>::max())) {
    detail = "empty certificate payload";
    return std::nullopt;
  }

  const auto* cursor = der.data();
  auto* raw = d2i_X509(nullptr, &cursor, static_cast<long>(der.size()));
  if (raw == nullptr) {
    detail = drain_openssl_errors("failed to parse x509 certificate");
    return std::nullopt;
  }
  auto x509 = std::shared_ptr<X509>{raw, X509_free};
  if (cursor != der.data() + der.size()) {
    detail = "trailing data after x509 certificate";
    return std::nullopt;
  }

  auto out = certificate{};
  out.der_ = warden::schema::make_bytes(der);
  // Populates the extension cache; EXFLAG_INVALID marks unparseable
  // extensions.
  auto flags = X509_get_extension_flags(x509.get());
  if ((flags & EXFLAG_INVALID) != 0) {
    detail = "x509 certificate carries invalid extensions";
    return std::nullopt;
  }
  out.is_ca_ = (flags & EXFLAG_CA) != 0;
  out.subject_ = name_to_string(X509_get_subject_name(x509.get()));
  out.issuer_ = name_to_string(X509_get_issuer_name(x509.get()));
  out.organizational_units_ =
      organizational_units_of(X509_get_subject_name(x509.get()));
  out.x509_ = std::move(x509);
  return out;
}

warden::schema::bytes_t certificate::pem() const {
  auto bio = bio_ptr{BIO_new(BIO_s_mem()), BIO_free_all};
  if (!bio || PEM_write_bio_X509(bio.get(), x509_.get()) != 1) {
    ERR_clear_error();
    return {};
  }
  auto* data = static_cast<char*>(nullptr);
  auto size = BIO_get_mem_data(bio.get(), &data);
  if (size <= 0 || data == nullptr) {
    return {};
  }
  return warden::schema::bytes_t{data, data + size};
}

}  // namespace warden::crypto
