#pragma once

#include <warden/crypto/openssl_provider.hpp>
#include <warden/msp/trust_store.hpp>
#include <warden/schema/primitives.hpp>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace warden::testing {

inline std::filesystem::path make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         (std::string{prefix} + "_" +
          std::to_string(static_cast<unsigned long long>(now)));
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline void write_file(const std::filesystem::path& path,
                       const std::string_view contents) {
  std::filesystem::create_directories(path.parent_path());
  auto output = std::ofstream{path, std::ios::binary | std::ios::trunc};
  output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

/// Removes the directory tree on destruction.
class scoped_directory final {
 public:
  explicit scoped_directory(const std::string_view prefix)
      : path_{make_temp_path(prefix)} {
    std::filesystem::create_directories(path_);
  }
  ~scoped_directory() { remove_path(path_); }

  scoped_directory(const scoped_directory&) = delete;
  scoped_directory& operator=(const scoped_directory&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

inline std::shared_ptr<spdlog::logger> make_quiet_logger() {
  return std::make_shared<spdlog::logger>(
      "warden_test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

inline warden::msp::trust_store_options make_options() {
  auto options = warden::msp::trust_store_options{};
  options.provider = warden::crypto::make_openssl_provider();
  options.logger = make_quiet_logger();
  return options;
}

}  // namespace warden::testing
