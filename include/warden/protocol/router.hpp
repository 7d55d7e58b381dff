#pragma once

#include <warden/execution/contract.hpp>
#include <warden/protocol/admin_transfer.hpp>
#include <warden/schema/module_record.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/role_id.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace warden::protocol {

inline constexpr auto kRouterCode = std::string_view{"warden.router"};

/// Smallest protected-call payload: module marker, module id and the rest of
/// the minimum module encoding.
inline constexpr auto kMinimumPayloadSize = std::size_t{64};

/// Message a registrar signs to admit `identity`, fronted by `host`, with
/// `admin` as its security admin:
/// BLAKE3(SCALE{"warden-registration-v1", chain_id, host, identity, admin}).
warden::schema::hash32_t make_registration_message(
    const warden::schema::hash32_t& chain_id,
    const warden::schema::address_t& host,
    const warden::schema::address_t& identity,
    const warden::schema::address_t& admin);

/// BLAKE3(SCALE(version)).
warden::schema::module_id_t make_module_id(std::string_view version);

/// Protocol coordinator, deployed behind a proxy and initialized through it.
///
/// Keeps no per-integration state: registrations are forwarded to the
/// GateKeeper once the registrar credential checks out, and protected calls
/// are routed to the security module named in the payload. Protocol-level
/// settings (admin, integration admins, registrar key, modules, pause) live in
/// the proxy's storage.
class router final : public warden::execution::contract {
 public:
  router(const warden::schema::address_t& self,
         const warden::schema::bytes_view_t& constructor_args);

 private:
  bool complete_registration(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const warden::schema::address_t& identity,
      const warden::schema::address_t& admin,
      const warden::schema::bytes_t& credential) const;

  bool dispatch_protected_call(warden::execution::host& runtime,
                               const warden::execution::call_frame& frame,
                               const warden::schema::address_t& caller,
                               const warden::schema::address_t& target_self,
                               const warden::schema::word_t& value,
                               uint64_t payload_length,
                               const warden::schema::bytes_t& data) const;

  warden::schema::address_t gate_keeper_address(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame) const;
  std::optional<warden::schema::module_record_t> module(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const warden::schema::module_id_t& id) const;
  bool has_role(warden::execution::host& runtime,
                const warden::execution::call_frame& frame,
                warden::schema::role_id_t role,
                const warden::schema::address_t& account) const;
  void require_initialized(warden::execution::host& runtime,
                           const warden::execution::call_frame& frame) const;
  void require_integration_admin(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame) const;

  /// Forward an override to the GateKeeper on behalf of the protocol.
  void forward_override(warden::execution::host& runtime,
                        const warden::execution::call_frame& frame,
                        const warden::schema::bytes_t& call_data) const;

  admin_transfer protocol_admin_{"protocol_admin"};
};

}  // namespace warden::protocol
