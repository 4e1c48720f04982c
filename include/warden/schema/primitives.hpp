#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const bytes_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace warden::schema
