#include <gtest/gtest.h>
#include <warden/msp/principal_evaluator.hpp>
#include <warden/msp/status.hpp>
#include <warden/msp/trust_store.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/msp_role.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/pki.hpp>

#include <memory>
#include <string>

namespace {

using warden::schema::msp_error_code;
using warden::schema::principal_classification_t;

warden::schema::msp_principal_t make_role_principal(const std::string& msp_id,
                                                    const uint32_t role) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  return warden::schema::msp_principal_t{
      .classification = static_cast<uint32_t>(principal_classification_t::role),
      .principal = encoder.encode(
          warden::schema::msp_role_t{.msp_identifier = msp_id, .role = role})};
}

uint32_t role_value(const warden::schema::msp_role_type_t role) {
  return static_cast<uint32_t>(role);
}

class principal_evaluator : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = std::make_unique<warden::testing::test_party>(
        warden::testing::make_root("root"));
    peer_ = std::make_unique<warden::testing::test_party>(
        warden::testing::make_leaf(*root_, "peer0"));
    other_peer_ = std::make_unique<warden::testing::test_party>(
        warden::testing::make_leaf(*root_, "peer1"));
    auto result = warden::schema::msp_result_t{};
    store_ = warden::msp::trust_store::setup(
        warden::testing::make_x509_config("org1", {root_.get()}),
        warden::testing::make_options(), result);
    ASSERT_NE(store_, nullptr) << warden::msp::describe(result);
    peer_id_ = identity_of(*peer_);
    other_peer_id_ = identity_of(*other_peer_);
  }

  std::shared_ptr<const warden::msp::identity> identity_of(
      const warden::testing::test_party& party) {
    auto result = warden::schema::msp_result_t{};
    auto id = store_->deserialize_identity(
        warden::testing::make_serialized_identity("org1", party), result);
    EXPECT_NE(id, nullptr) << warden::msp::describe(result);
    return id;
  }

  std::unique_ptr<warden::testing::test_party> root_;
  std::unique_ptr<warden::testing::test_party> peer_;
  std::unique_ptr<warden::testing::test_party> other_peer_;
  std::shared_ptr<const warden::msp::trust_store> store_;
  std::shared_ptr<const warden::msp::identity> peer_id_;
  std::shared_ptr<const warden::msp::identity> other_peer_id_;
};

}  // namespace

TEST_F(principal_evaluator, member_role_requires_valid_identity) {
  auto principal = make_role_principal(
      "org1", role_value(warden::schema::msp_role_type_t::member));
  auto result = peer_id_->satisfies_principal(principal);
  EXPECT_TRUE(warden::msp::is_ok(result)) << warden::msp::describe(result);
}

TEST_F(principal_evaluator, member_role_fails_for_ca_identity) {
  auto root_id = identity_of(*root_);
  ASSERT_NE(root_id, nullptr);
  auto principal = make_role_principal(
      "org1", role_value(warden::schema::msp_role_type_t::member));
  EXPECT_EQ(warden::msp::error_code_of(root_id->satisfies_principal(principal)),
            msp_error_code::ca_used_as_identity);
}

TEST_F(principal_evaluator, role_for_other_msp_is_domain_mismatch) {
  auto principal = make_role_principal(
      "org2", role_value(warden::schema::msp_role_type_t::member));
  EXPECT_EQ(warden::msp::error_code_of(
                warden::msp::satisfies_principal(*store_, *peer_id_, principal)),
            msp_error_code::domain_mismatch);
}

TEST_F(principal_evaluator, admin_role_is_never_satisfied) {
  auto principal = make_role_principal(
      "org1", role_value(warden::schema::msp_role_type_t::admin));
  EXPECT_EQ(warden::msp::error_code_of(peer_id_->satisfies_principal(principal)),
            msp_error_code::not_implemented);
}

TEST_F(principal_evaluator, unknown_role_is_reported) {
  auto principal = make_role_principal("org1", 5);
  EXPECT_EQ(warden::msp::error_code_of(peer_id_->satisfies_principal(principal)),
            msp_error_code::unknown_role);
}

TEST_F(principal_evaluator, undecodable_role_payload_is_decode_error) {
  auto principal = warden::schema::msp_principal_t{
      .classification = static_cast<uint32_t>(principal_classification_t::role),
      .principal = warden::schema::bytes_t{0x04}};
  EXPECT_EQ(warden::msp::error_code_of(peer_id_->satisfies_principal(principal)),
            msp_error_code::decode_error);
}

TEST_F(principal_evaluator, identity_principal_matches_own_serialization) {
  auto principal = warden::schema::msp_principal_t{
      .classification =
          static_cast<uint32_t>(principal_classification_t::identity),
      .principal = peer_id_->serialize()};
  EXPECT_TRUE(warden::msp::is_ok(peer_id_->satisfies_principal(principal)));
}

TEST_F(principal_evaluator, identity_principal_rejects_other_identity) {
  auto principal = warden::schema::msp_principal_t{
      .classification =
          static_cast<uint32_t>(principal_classification_t::identity),
      .principal = other_peer_id_->serialize()};
  EXPECT_EQ(warden::msp::error_code_of(peer_id_->satisfies_principal(principal)),
            msp_error_code::identity_mismatch);
}

TEST_F(principal_evaluator, organization_unit_is_never_satisfied) {
  auto principal = warden::schema::msp_principal_t{
      .classification =
          static_cast<uint32_t>(principal_classification_t::organization_unit),
      .principal = warden::schema::make_bytes(std::string{"engineering"})};
  EXPECT_EQ(warden::msp::error_code_of(peer_id_->satisfies_principal(principal)),
            msp_error_code::not_implemented);
}

TEST_F(principal_evaluator, unknown_classification_is_reported) {
  auto principal = warden::schema::msp_principal_t{
      .classification = 17, .principal = peer_id_->serialize()};
  EXPECT_EQ(warden::msp::error_code_of(store_->satisfies_principal(*peer_id_,
                                                                   principal)),
            msp_error_code::unknown_principal_type);
}

TEST_F(principal_evaluator, role_is_checked_against_the_evaluating_store) {
  auto other_root = warden::testing::make_root("org2-root");
  auto other_leaf = warden::testing::make_leaf(other_root, "peer0.org2");
  auto result = warden::schema::msp_result_t{};
  auto other_store = warden::msp::trust_store::setup(
      warden::testing::make_x509_config("org2", {&other_root}),
      warden::testing::make_options(), result);
  ASSERT_NE(other_store, nullptr) << warden::msp::describe(result);

  // Claims org1 but chains to org2's root.
  auto claimed = identity_of(other_leaf);
  ASSERT_NE(claimed, nullptr);

  auto as_org1 = make_role_principal(
      "org1", role_value(warden::schema::msp_role_type_t::member));
  EXPECT_EQ(warden::msp::error_code_of(
                other_store->satisfies_principal(*claimed, as_org1)),
            msp_error_code::domain_mismatch);

  auto as_org2 = make_role_principal(
      "org2", role_value(warden::schema::msp_role_type_t::member));
  EXPECT_EQ(warden::msp::error_code_of(
                other_store->satisfies_principal(*claimed, as_org2)),
            msp_error_code::domain_mismatch);
}
