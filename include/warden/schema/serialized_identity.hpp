#pragma once

#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct serialized_identity;

/// Wire form of an identity: the provider name and a PEM certificate.
template <>
struct serialized_identity<1> final {
  uint16_t version{1};
  std::string msp_id;
  bytes_t id_bytes;
};

using serialized_identity_t = serialized_identity<1>;

}  // namespace warden::schema
