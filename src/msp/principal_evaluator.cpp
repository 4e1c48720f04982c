#include <warden/msp/identity.hpp>
#include <warden/msp/principal_evaluator.hpp>
#include <warden/msp/status.hpp>
#include <warden/msp/trust_store.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/msp_role.hpp>
#include <warden/schema/principal_classification.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

using warden::schema::msp_error_code;
using warden::schema::msp_role_type_t;
using warden::schema::principal_classification_t;

namespace warden::msp {

namespace {

warden::schema::msp_result_t satisfies_role(
    const trust_store& store,
    const identity& id,
    const warden::schema::bytes_t& payload) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto role = encoder.try_decode<warden::schema::msp_role_t>(payload);
  if (!role) {
    return make_error(msp_error_code::decode_error,
                      "could not parse MSPRole", {}, kPrincipalCodespace);
  }

  if (role->msp_identifier != store.name() ||
      role->msp_identifier != id.msp_identifier()) {
    return make_error(
        msp_error_code::domain_mismatch,
        fmt::format("the identity is a member of a different MSP (expected "
                    "{}, got {})",
                    role->msp_identifier, id.msp_identifier()),
        {}, kPrincipalCodespace);
  }

  switch (static_cast<msp_role_type_t>(role->role)) {
    case msp_role_type_t::member:
      store.logger().debug("Checking if identity satisfies MEMBER role for {}",
                           store.name());
      return store.validate(id);
    case msp_role_type_t::admin:
      return make_error(msp_error_code::not_implemented,
                        "the ADMIN role is not supported", store.name(),
                        kPrincipalCodespace);
  }
  return make_error(msp_error_code::unknown_role,
                    fmt::format("invalid MSP role type {}", role->role), {},
                    kPrincipalCodespace);
}

warden::schema::msp_result_t satisfies_identity(
    const identity& id,
    const warden::schema::bytes_t& payload) {
  auto serialized = id.serialize();
  if (!std::ranges::equal(serialized, payload)) {
    return make_error(msp_error_code::identity_mismatch,
                      "the identities do not match", {}, kPrincipalCodespace);
  }
  return make_ok();
}

}  // namespace

warden::schema::msp_result_t satisfies_principal(
    const trust_store& store,
    const identity& id,
    const warden::schema::msp_principal_t& principal) {
  switch (static_cast<principal_classification_t>(principal.classification)) {
    case principal_classification_t::role:
      return satisfies_role(store, id, principal.principal);
    case principal_classification_t::identity:
      return satisfies_identity(id, principal.principal);
    case principal_classification_t::organization_unit:
      return make_error(msp_error_code::not_implemented,
                        "organization unit principals are not supported", {},
                        kPrincipalCodespace);
  }
  return make_error(
      msp_error_code::unknown_principal_type,
      fmt::format("invalid principal type {}", principal.classification), {},
      kPrincipalCodespace);
}

}  // namespace warden::msp
