#pragma once

#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace warden::common {

// Internal invariant violations only. Malformed external input must be
// reported through an msp_result, never through this path. The logger
// registry belongs to the embedding process and is left running.
[[noreturn]] inline void critical(const std::string_view message) {
  auto logger = spdlog::default_logger();
  logger->critical("warden invariant violated: {}", message);
  logger->flush();
  std::terminate();
}

}  // namespace warden::common
