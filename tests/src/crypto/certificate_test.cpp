#include <gtest/gtest.h>
#include <warden/crypto/certificate.hpp>
#include <warden/testing/pki.hpp>

#include <string>

namespace {

std::optional<warden::crypto::certificate> parse(
    const std::string& pem,
    warden::crypto::certificate_error& error) {
  auto detail = std::string{};
  return warden::crypto::certificate::from_pem(
      warden::schema::make_bytes_view(pem), error, detail);
}

}  // namespace

TEST(certificate, parses_pem_and_reports_ca_flag) {
  auto root = warden::testing::make_root("root");
  auto leaf = warden::testing::make_leaf(root, "peer0", "engineering");

  auto error = warden::crypto::certificate_error::none;
  auto root_cert = parse(root.cert_pem(), error);
  ASSERT_TRUE(root_cert.has_value());
  EXPECT_TRUE(root_cert->is_ca());

  auto leaf_cert = parse(leaf.cert_pem(), error);
  ASSERT_TRUE(leaf_cert.has_value());
  EXPECT_FALSE(leaf_cert->is_ca());
  EXPECT_NE(leaf_cert->subject().find("CN=peer0"), std::string::npos);
  EXPECT_NE(leaf_cert->issuer().find("CN=root"), std::string::npos);
  ASSERT_EQ(leaf_cert->organizational_units().size(), 1u);
  EXPECT_EQ(leaf_cert->organizational_units()[0], "engineering");
}

TEST(certificate, pem_reencoding_is_stable) {
  auto root = warden::testing::make_root("root");
  auto error = warden::crypto::certificate_error::none;
  auto cert = parse(root.cert_pem(), error);
  ASSERT_TRUE(cert.has_value());
  EXPECT_EQ(warden::schema::make_string(cert->pem()), root.cert_pem());

  auto reparsed = parse(warden::schema::make_string(cert->pem()), error);
  ASSERT_TRUE(reparsed.has_value());
  EXPECT_EQ(*reparsed, *cert);
}

TEST(certificate, non_pem_input_is_not_pem) {
  auto error = warden::crypto::certificate_error::none;
  EXPECT_FALSE(parse("definitely not a certificate", error).has_value());
  EXPECT_EQ(error, warden::crypto::certificate_error::not_pem);

  EXPECT_FALSE(parse("", error).has_value());
  EXPECT_EQ(error, warden::crypto::certificate_error::not_pem);
}

TEST(certificate, pem_block_with_garbage_payload_is_malformed) {
  auto pem = std::string{
      "-----BEGIN CERTIFICATE-----\n"
      "aGVsbG8gd29ybGQ=\n"
      "-----END CERTIFICATE-----\n"};
  auto error = warden::crypto::certificate_error::none;
  EXPECT_FALSE(parse(pem, error).has_value());
  EXPECT_EQ(error, warden::crypto::certificate_error::malformed);
}

TEST(certificate, private_key_block_is_malformed) {
  auto root = warden::testing::make_root("root");
  auto error = warden::crypto::certificate_error::none;
  EXPECT_FALSE(parse(root.key_pem(), error).has_value());
  EXPECT_EQ(error, warden::crypto::certificate_error::malformed);
}

TEST(certificate, der_with_trailing_bytes_is_rejected) {
  auto root = warden::testing::make_root("root");
  auto error = warden::crypto::certificate_error::none;
  auto cert = parse(root.cert_pem(), error);
  ASSERT_TRUE(cert.has_value());

  auto der = cert->der();
  der.push_back(0x00);
  auto detail = std::string{};
  EXPECT_FALSE(warden::crypto::certificate::from_der(der, detail).has_value());
  EXPECT_FALSE(detail.empty());
}
