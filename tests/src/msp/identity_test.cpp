#include <gtest/gtest.h>
#include <warden/msp/identity.hpp>
#include <warden/msp/status.hpp>
#include <warden/msp/trust_store.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/serialized_identity.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/pki.hpp>

#include <string>

using warden::schema::msp_error_code;

TEST(identity, exposes_certificate_details) {
  auto root = warden::testing::make_root("root");
  auto leaf = warden::testing::make_leaf(root, "peer0", "engineering");
  auto result = warden::schema::msp_result_t{};
  auto store = warden::msp::trust_store::setup(
      warden::testing::make_x509_config("org1", {&root}),
      warden::testing::make_options(), result);
  ASSERT_NE(store, nullptr);

  auto id = store->deserialize_identity(
      warden::testing::make_serialized_identity("org1", leaf), result);
  ASSERT_NE(id, nullptr);
  EXPECT_EQ(id->msp_identifier(), "org1");
  EXPECT_EQ(id->identifier().msp_id, "org1");
  EXPECT_FALSE(id->certificate().is_ca());
  ASSERT_NE(id->public_key(), nullptr);
  EXPECT_FALSE(id->public_key()->is_private());
  ASSERT_EQ(id->organizational_units().size(), 1u);
  EXPECT_EQ(id->organizational_units()[0], "engineering");
}

TEST(identity, serialize_carries_msp_id_and_pem) {
  auto root = warden::testing::make_root("root");
  auto leaf = warden::testing::make_leaf(root, "peer0");
  auto result = warden::schema::msp_result_t{};
  auto store = warden::msp::trust_store::setup(
      warden::testing::make_x509_config("org1", {&root}),
      warden::testing::make_options(), result);
  ASSERT_NE(store, nullptr);
  auto id = store->deserialize_identity(
      warden::testing::make_serialized_identity("org1", leaf), result);
  ASSERT_NE(id, nullptr);

  auto decoded = warden::schema::encoding::scale_encoder_t{}
                     .try_decode<warden::schema::serialized_identity_t>(
                         id->serialize());
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->msp_id, "org1");
  EXPECT_EQ(warden::schema::make_string(decoded->id_bytes), leaf.cert_pem());
}

TEST(identity, verify_rejects_empty_and_foreign_signatures) {
  auto root = warden::testing::make_root("root");
  auto signer = warden::testing::make_leaf(root, "signer");
  auto other = warden::testing::make_leaf(root, "other");
  auto config = warden::testing::make_x509_config("org1", {&root});
  config.signing_identity = warden::testing::make_signing_info(signer, signer);
  auto result = warden::schema::msp_result_t{};
  auto store = warden::msp::trust_store::setup(
      config, warden::testing::make_options(), result);
  ASSERT_NE(store, nullptr) << warden::msp::describe(result);

  auto signing = store->default_signing_identity(result);
  ASSERT_NE(signing, nullptr);
  auto message = std::string{"message"};
  auto signature =
      signing->sign(warden::schema::make_bytes_view(message), result);
  ASSERT_TRUE(signature.has_value());

  auto other_id = store->deserialize_identity(
      warden::testing::make_serialized_identity("org1", other), result);
  ASSERT_NE(other_id, nullptr);
  EXPECT_EQ(warden::msp::error_code_of(other_id->verify(
                warden::schema::make_bytes_view(message), *signature)),
            msp_error_code::signature_verification_failed);
  EXPECT_EQ(warden::msp::error_code_of(signing->verify(
                warden::schema::make_bytes_view(message),
                warden::schema::bytes_t{})),
            msp_error_code::signature_verification_failed);
}

TEST(identity, ed25519_signing_identity_round_trips) {
  auto root = warden::testing::issue(
      warden::testing::cert_options{.common_name = "ed-root",
                                    .is_ca = true,
                                    .key = warden::testing::make_ed25519_key()},
      nullptr);
  auto signer = warden::testing::issue(
      warden::testing::cert_options{.common_name = "ed-signer",
                                    .key = warden::testing::make_ed25519_key()},
      &root);
  auto config = warden::testing::make_x509_config("org1", {&root});
  config.signing_identity = warden::testing::make_signing_info(signer, signer);
  auto result = warden::schema::msp_result_t{};
  auto store = warden::msp::trust_store::setup(
      config, warden::testing::make_options(), result);
  ASSERT_NE(store, nullptr) << warden::msp::describe(result);

  auto signing = store->default_signing_identity(result);
  ASSERT_NE(signing, nullptr);
  EXPECT_TRUE(warden::msp::is_ok(signing->validate()));
  auto message = std::string{"ed25519 message"};
  auto signature =
      signing->sign(warden::schema::make_bytes_view(message), result);
  ASSERT_TRUE(signature.has_value()) << warden::msp::describe(result);
  EXPECT_TRUE(warden::msp::is_ok(signing->public_version()->verify(
      warden::schema::make_bytes_view(message), *signature)));
}

TEST(identity, public_version_keeps_identity_fields) {
  auto root = warden::testing::make_root("root");
  auto signer = warden::testing::make_leaf(root, "signer");
  auto config = warden::testing::make_x509_config("org1", {&root});
  config.signing_identity = warden::testing::make_signing_info(signer, signer);
  auto result = warden::schema::msp_result_t{};
  auto store = warden::msp::trust_store::setup(
      config, warden::testing::make_options(), result);
  ASSERT_NE(store, nullptr);

  auto signing = store->default_signing_identity(result);
  ASSERT_NE(signing, nullptr);
  auto plain = signing->public_version();
  EXPECT_EQ(plain->identifier(), signing->identifier());
  EXPECT_EQ(plain->certificate(), signing->certificate());
  EXPECT_EQ(plain->serialize(), signing->serialize());
  EXPECT_TRUE(warden::msp::is_ok(plain->validate()));
}
