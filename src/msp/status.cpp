#include <warden/msp/status.hpp>

#include <utility>

namespace warden::msp {

warden::schema::msp_result_t make_ok() {
  return warden::schema::msp_result_t{};
}

warden::schema::msp_result_t make_error(
    const warden::schema::msp_error_code code,
    std::string log,
    std::string info,
    const std::string_view codespace) {
  auto result = warden::schema::msp_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

bool is_ok(const warden::schema::msp_result_t& result) {
  return result.code ==
         static_cast<uint32_t>(warden::schema::msp_error_code::ok);
}

warden::schema::msp_error_code error_code_of(
    const warden::schema::msp_result_t& result) {
  return static_cast<warden::schema::msp_error_code>(result.code);
}

std::string describe(const warden::schema::msp_result_t& result) {
  if (is_ok(result)) {
    return "ok";
  }
  auto out = result.codespace.empty() ? std::string{"warden"}
                                      : result.codespace;
  out += ": ";
  auto code = warden::schema::try_from_wire<warden::schema::msp_error_code>(
      result.code);
  out += code ? warden::schema::to_string(*code) : "unknown";
  out += " (" + std::to_string(result.code) + "): ";
  out += result.log;
  if (!result.info.empty()) {
    out += ": " + result.info;
  }
  return out;
}

}  // namespace warden::msp
