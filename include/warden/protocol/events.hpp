#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_event.hpp>

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace warden::protocol::events {

inline constexpr std::string_view kAdminTransferStarted{
    "admin_transfer_started"};
inline constexpr std::string_view kAdminTransferred{"admin_transferred"};
inline constexpr std::string_view kRegistrationStatusChanged{
    "registration_status_changed"};
inline constexpr std::string_view kAuthorizationStatusChanged{
    "authorization_status_changed"};
inline constexpr std::string_view kProtectionFlagsUpdated{
    "protection_flags_updated"};
inline constexpr std::string_view kUpgradePreAuthorized{
    "upgrade_pre_authorized"};
inline constexpr std::string_view kRouterInitialized{"router_initialized"};
inline constexpr std::string_view kRoleChanged{"role_changed"};
inline constexpr std::string_view kModuleInstalled{"module_installed"};
inline constexpr std::string_view kModuleDeprecated{"module_deprecated"};
inline constexpr std::string_view kRegistrarKeyChanged{
    "registrar_key_changed"};
inline constexpr std::string_view kPausedChanged{"paused_changed"};

inline warden::schema::transaction_event_attribute_t attribute(
    std::string_view key,
    std::string value,
    bool index = false) {
  return warden::schema::transaction_event_attribute_t{
      .key = std::string{key}, .value = std::move(value), .index = index};
}

inline warden::schema::transaction_event_t make_event(
    std::string_view type,
    std::initializer_list<warden::schema::transaction_event_attribute_t>
        attributes) {
  return warden::schema::transaction_event_t{.type = std::string{type},
                                             .attributes = attributes};
}

/// Value of the first attribute named `key`, or an empty string.
inline std::string attribute_value(
    const warden::schema::transaction_event_t& event,
    std::string_view key) {
  for (const auto& entry : event.attributes) {
    if (entry.key == key) {
      return entry.value;
    }
  }
  return {};
}

}  // namespace warden::protocol::events
