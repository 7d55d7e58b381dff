#pragma once

#include <warden/execution/code_registry.hpp>
#include <warden/execution/engine.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>

namespace warden::protocol {

struct protocol_addresses final {
  warden::schema::address_t router_logic{};
  warden::schema::address_t router{};
  warden::schema::address_t gate_keeper{};
};

/// Register the router and GateKeeper code units.
void register_protocol_code(warden::execution::code_registry& registry);

/// Deploy the protocol from `deployer`: router logic, a router proxy
/// administered by `protocol_admin`, the GateKeeper bound to that proxy, and
/// finally `initialize` on the router proxy. Throws protocol_error with the
/// failing request's code.
protocol_addresses deploy_protocol(
    warden::execution::engine& engine,
    const warden::schema::address_t& deployer,
    const warden::schema::address_t& protocol_admin,
    const warden::schema::registrar_key_t& registrar_key);

/// Addresses a previous `deploy_protocol` from `deployer` produced, or
/// std::nullopt when the protocol has not been deployed by it.
std::optional<protocol_addresses> find_protocol(
    const warden::execution::engine& engine,
    const warden::schema::address_t& deployer);

}  // namespace warden::protocol
