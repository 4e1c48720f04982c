#pragma once
#include <warden/common/critical.hpp>
#include <warden/schema/encoding/encoder.hpp>
#include <warden/schema/encoding/scale/msp_config.hpp>
#include <warden/schema/encoding/scale/msp_principal.hpp>
#include <warden/schema/encoding/scale/msp_result.hpp>
#include <warden/schema/encoding/scale/msp_role.hpp>
#include <warden/schema/encoding/scale/serialized_identity.hpp>
#include <exception>
#include <optional>
#include <scale/scale.hpp>

namespace warden::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  warden::schema::bytes_t encode(const T& obj);

  /// Decode trusted bytes; a failure is an internal invariant violation.
  template <typename T>
  T decode(const warden::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes; never terminates on malformed input.
  template <typename T>
  std::optional<T> try_decode(const warden::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
warden::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    warden::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const warden::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    warden::common::critical("failed to decode SCALE bytes");
  }
  return *decoded;
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const warden::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return decoded.value();
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace warden::schema::encoding
