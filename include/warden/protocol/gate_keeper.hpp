#pragma once

#include <warden/execution/contract.hpp>
#include <warden/protocol/status_ledger.hpp>
#include <warden/schema/primitives.hpp>

#include <string_view>

namespace warden::protocol {

inline constexpr auto kGateKeeperCode = std::string_view{"warden.gate_keeper"};

/// Shared ledger contract. Integrations write their own entries
/// (self-authenticated); the router, fixed at construction, completes
/// registrations and applies protocol overrides. Reads are open to anyone.
///
/// Constructor arguments: SCALE(router address).
class gate_keeper final : public warden::execution::contract {
 public:
  gate_keeper(const warden::schema::address_t& self,
              const warden::schema::bytes_view_t& constructor_args);

  const warden::schema::address_t& router() const noexcept { return router_; }

 private:
  void require_router(const warden::execution::call_frame& frame) const;

  warden::schema::address_t router_;
  status_ledger ledger_;
};

}  // namespace warden::protocol
