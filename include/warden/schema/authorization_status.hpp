#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: authorization status.
// Active is only reached by completing registration. Bypassed and revoked are
// set by the protocol through the router; revoked fails every protected call.
namespace warden::schema {

enum class authorization_status_t : uint8_t {
  inactive = 0,
  active = 1,
  bypassed = 2,
  revoked = 3
};

inline constexpr auto kAuthorizationStatusMappings =
    std::array{std::pair<std::string_view, authorization_status_t>{
                   "inactive", authorization_status_t::inactive},
               std::pair<std::string_view, authorization_status_t>{
                   "active", authorization_status_t::active},
               std::pair<std::string_view, authorization_status_t>{
                   "bypassed", authorization_status_t::bypassed},
               std::pair<std::string_view, authorization_status_t>{
                   "revoked", authorization_status_t::revoked}};

template <>
inline std::optional<authorization_status_t>
try_from_string<authorization_status_t>(const std::string_view value) {
  return from_string(value, kAuthorizationStatusMappings);
}

inline constexpr std::string_view to_string(
    const authorization_status_t value) {
  return to_string(value, kAuthorizationStatusMappings).value_or("unknown");
}

}  // namespace warden::schema
