#pragma once

#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace warden::testing {

using scale_encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

inline warden::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = warden::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline warden::schema::address_t make_account(const uint8_t seed) {
  auto out = warden::schema::address_t{};
  out[0] = 0xEE;
  out[19] = seed;
  return out;
}

inline warden::schema::bytes_t make_filled(const std::size_t size,
                                           const uint8_t value = 0x11) {
  return warden::schema::bytes_t(size, value);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace warden::testing
