#pragma once

#include <warden/schema/error_code.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace warden::execution {

/// Structured failure of a request. Thrown anywhere inside a call chain, it
/// unwinds every nested frame and the engine discards the request's writes.
class protocol_error final : public std::runtime_error {
 public:
  explicit protocol_error(const warden::schema::error_code code,
                          std::string detail = {})
      : std::runtime_error{describe(code, detail)},
        code_{code},
        detail_{std::move(detail)} {}

  warden::schema::error_code code() const noexcept { return code_; }
  const std::string& detail() const noexcept { return detail_; }

 private:
  static std::string describe(const warden::schema::error_code code,
                              const std::string& detail) {
    auto message = std::string{warden::schema::to_string(code)};
    if (!detail.empty()) {
      message += ": " + detail;
    }
    return message;
  }

  warden::schema::error_code code_;
  std::string detail_;
};

/// Throw `protocol_error{code, detail}` unless `condition` holds.
inline void require(const bool condition,
                    const warden::schema::error_code code,
                    const std::string_view detail = {}) {
  if (!condition) {
    throw protocol_error{code, std::string{detail}};
  }
}

}  // namespace warden::execution
