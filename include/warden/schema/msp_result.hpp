#pragma once

#include <cstdint>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct msp_result;

/// Outcome of an MSP operation. `code` carries an msp_error_code value,
/// `log` a short description, `info` diagnostic detail (for example the PKI
/// reason behind a chain failure) and `codespace` the operation family.
template <>
struct msp_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
};

using msp_result_t = msp_result<1>;

}  // namespace warden::schema
