#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: registration status.
// Integration lifecycle: unregistered -> pending -> registered. Only the
// registrar credential check (or a protocol override) reaches registered.
namespace warden::schema {

enum class registration_status_t : uint8_t {
  unregistered = 0,
  pending = 1,
  registered = 2
};

inline constexpr auto kRegistrationStatusMappings =
    std::array{std::pair<std::string_view, registration_status_t>{
                   "unregistered", registration_status_t::unregistered},
               std::pair<std::string_view, registration_status_t>{
                   "pending", registration_status_t::pending},
               std::pair<std::string_view, registration_status_t>{
                   "registered", registration_status_t::registered}};

template <>
inline std::optional<registration_status_t>
try_from_string<registration_status_t>(const std::string_view value) {
  return from_string(value, kRegistrationStatusMappings);
}

inline constexpr std::string_view to_string(const registration_status_t value) {
  return to_string(value, kRegistrationStatusMappings).value_or("unknown");
}

}  // namespace warden::schema
