#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Protocol roles held on the router: the protocol admin manages modules,
// registrar key and pause; integration admins repair ledger statuses.
namespace warden::schema {

enum class role_id_t : uint8_t { protocol_admin = 0, integration_admin = 1 };

inline constexpr auto kRoleIdMappings =
    std::array{std::pair<std::string_view, role_id_t>{
                   "protocol_admin", role_id_t::protocol_admin},
               std::pair<std::string_view, role_id_t>{
                   "integration_admin", role_id_t::integration_admin}};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

}  // namespace warden::schema
