#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/principal_classification.hpp>

#include <cstdint>

namespace warden::schema {

template <uint16_t Version>
struct msp_principal;

template <>
struct msp_principal<1> final {
  uint16_t version{1};
  uint32_t classification{
      static_cast<uint32_t>(principal_classification_t::role)};
  bytes_t principal;
};

using msp_principal_t = msp_principal<1>;

}  // namespace warden::schema
