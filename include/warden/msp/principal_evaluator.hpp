#pragma once

#include <warden/schema/msp_principal.hpp>
#include <warden/schema/msp_result.hpp>

namespace warden::msp {

class identity;
class trust_store;

/// Decide whether `id` satisfies `principal` in the context of `store`.
///
/// role: the role's msp_identifier must name both `store` and the MSP `id`
///   claims; member requires a valid identity, admin is not supported.
/// identity: the payload must equal id.serialize() byte for byte.
/// organization_unit: not supported.
warden::schema::msp_result_t satisfies_principal(
    const trust_store& store,
    const identity& id,
    const warden::schema::msp_principal_t& principal);

}  // namespace warden::msp
