#include <gtest/gtest.h>
#include <warden/msp/config_loader.hpp>
#include <warden/msp/status.hpp>
#include <warden/msp/trust_store.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/pki.hpp>

#include <optional>
#include <string>

using warden::schema::msp_error_code;

TEST(config_loader, loads_usable_configuration_from_directory) {
  auto dir = warden::testing::scoped_directory{"warden_msp_dir"};
  auto root = warden::testing::make_root("root");
  auto intermediate = warden::testing::make_intermediate(root, "ica");
  auto signer = warden::testing::make_leaf(intermediate, "signer");
  auto admin = warden::testing::make_leaf(intermediate, "admin");
  warden::testing::write_file(dir.path() / "cacerts" / "ca.pem",
                              root.cert_pem());
  warden::testing::write_file(dir.path() / "intermediatecerts" / "ica.pem",
                              intermediate.cert_pem());
  warden::testing::write_file(dir.path() / "admincerts" / "admin.pem",
                              admin.cert_pem());
  warden::testing::write_file(dir.path() / "signcerts" / "cert.pem",
                              signer.cert_pem());
  warden::testing::write_file(dir.path() / "keystore" / "key_sk",
                              signer.key_pem());

  auto result = warden::schema::msp_result_t{};
  auto config = warden::msp::load_x509_msp_config(dir.path(), "org1", result);
  ASSERT_TRUE(config.has_value()) << warden::msp::describe(result);
  EXPECT_EQ(config->name, "org1");
  EXPECT_EQ(config->root_certs.size(), 1u);
  EXPECT_EQ(config->intermediate_certs.size(), 1u);
  EXPECT_EQ(config->admins.size(), 1u);
  ASSERT_TRUE(config->signing_identity.has_value());
  EXPECT_EQ(config->signing_identity->private_signer.key_identifier, "key_sk");

  auto store = warden::msp::trust_store::setup(
      warden::msp::make_msp_config(*config), warden::testing::make_options(),
      result);
  ASSERT_NE(store, nullptr) << warden::msp::describe(result);
  auto signing = store->default_signing_identity(result);
  ASSERT_NE(signing, nullptr);
  EXPECT_TRUE(warden::msp::is_ok(signing->validate()));
}

TEST(config_loader, roots_only_directory_has_no_signing_identity) {
  auto dir = warden::testing::scoped_directory{"warden_msp_dir"};
  auto root = warden::testing::make_root("root");
  warden::testing::write_file(dir.path() / "cacerts" / "ca.pem",
                              root.cert_pem());

  auto result = warden::schema::msp_result_t{};
  auto config = warden::msp::load_x509_msp_config(dir.path(), "org1", result);
  ASSERT_TRUE(config.has_value()) << warden::msp::describe(result);
  EXPECT_FALSE(config->signing_identity.has_value());
  EXPECT_TRUE(config->intermediate_certs.empty());
}

TEST(config_loader, missing_cacerts_is_config_error) {
  auto dir = warden::testing::scoped_directory{"warden_msp_dir"};
  auto result = warden::schema::msp_result_t{};
  EXPECT_FALSE(
      warden::msp::load_x509_msp_config(dir.path(), "org1", result)
          .has_value());
  EXPECT_EQ(warden::msp::error_code_of(result), msp_error_code::config_error);
}

TEST(config_loader, unusable_path_is_reported_not_thrown) {
  auto dir = warden::testing::scoped_directory{"warden_msp_dir"};
  auto result = warden::schema::msp_result_t{};
  auto config = std::optional<warden::schema::x509_msp_config_t>{};
  EXPECT_NO_THROW(config = warden::msp::load_x509_msp_config(
                      dir.path() / std::string(300, 'a'), "org1", result));
  EXPECT_FALSE(config.has_value());
  EXPECT_EQ(warden::msp::error_code_of(result), msp_error_code::config_error);
}

TEST(config_loader, cacerts_as_plain_file_is_config_error) {
  auto dir = warden::testing::scoped_directory{"warden_msp_dir"};
  warden::testing::write_file(dir.path() / "cacerts", "not a directory");
  auto result = warden::schema::msp_result_t{};
  EXPECT_FALSE(
      warden::msp::load_x509_msp_config(dir.path(), "org1", result)
          .has_value());
  EXPECT_EQ(warden::msp::error_code_of(result), msp_error_code::config_error);
}

TEST(config_loader, empty_cacerts_is_config_error) {
  auto dir = warden::testing::scoped_directory{"warden_msp_dir"};
  std::filesystem::create_directories(dir.path() / "cacerts");
  auto result = warden::schema::msp_result_t{};
  EXPECT_FALSE(
      warden::msp::load_x509_msp_config(dir.path(), "org1", result)
          .has_value());
  EXPECT_EQ(warden::msp::error_code_of(result), msp_error_code::config_error);
}

TEST(config_loader, signing_certificate_without_key_is_config_error) {
  auto dir = warden::testing::scoped_directory{"warden_msp_dir"};
  auto root = warden::testing::make_root("root");
  auto signer = warden::testing::make_leaf(root, "signer");
  warden::testing::write_file(dir.path() / "cacerts" / "ca.pem",
                              root.cert_pem());
  warden::testing::write_file(dir.path() / "signcerts" / "cert.pem",
                              signer.cert_pem());

  auto result = warden::schema::msp_result_t{};
  EXPECT_FALSE(
      warden::msp::load_x509_msp_config(dir.path(), "org1", result)
          .has_value());
  EXPECT_EQ(warden::msp::error_code_of(result), msp_error_code::config_error);
}

TEST(config_loader, make_msp_config_wraps_x509_record) {
  auto root = warden::testing::make_root("root");
  auto envelope = warden::msp::make_msp_config(
      warden::testing::make_x509_config("org1", {&root}));
  EXPECT_EQ(envelope.type,
            static_cast<uint32_t>(warden::schema::provider_type_t::x509));
  EXPECT_FALSE(envelope.config.empty());
}
