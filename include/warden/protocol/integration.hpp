#pragma once

#include <warden/execution/contract.hpp>
#include <warden/protocol/admin_transfer.hpp>
#include <warden/schema/primitives.hpp>

#include <vector>

namespace warden::protocol {

/// Base of every contract whose operations can be gated by the protocol.
///
/// Constructor arguments: SCALE(std::tuple{router, gate_keeper}). Derived
/// contracts call `guard` at the top of each guarded operation, passing the
/// payload argument. The payload must be the last argument of the operation so
/// that its bytes form the tail of the invocation data.
class integration : public warden::execution::contract {
 public:
  integration(const warden::schema::address_t& self,
              const warden::schema::bytes_view_t& constructor_args);

  const warden::schema::address_t& router_address() const noexcept {
    return router_;
  }
  const warden::schema::address_t& gate_keeper_address() const noexcept {
    return gate_keeper_;
  }

 protected:
  /// Runs the protected-call state machine for the operation in `frame`.
  /// Returns normally when the operation body may proceed.
  void guard(warden::execution::host& runtime,
             const warden::execution::call_frame& frame,
             const warden::schema::bytes_t& payload) const;

  const admin_transfer& security_admin() const noexcept {
    return security_admin_;
  }

  /// Fails with DelegationNotPermitted when `frame` runs this code against
  /// storage it does not own.
  virtual void check_identity(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame) const = 0;

  virtual bool protection_enabled(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const warden::schema::selector_t& selector) const = 0;

  virtual std::vector<bool> protection_status(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const std::vector<warden::schema::selector_t>& selectors) const = 0;

  virtual void write_protection(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const std::vector<warden::schema::selector_t>& selectors,
      const std::vector<bool>& flags) const = 0;

  /// Put this logic unit's identity on the ledger, fronted by `frame.self`.
  void pre_register(warden::execution::host& runtime,
                    const warden::execution::call_frame& frame) const;

 private:
  void register_with_defaults(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const warden::schema::bytes_t& credential,
      const std::vector<warden::schema::selector_t>& selectors) const;

  warden::schema::address_t router_;
  warden::schema::address_t gate_keeper_;
  admin_transfer security_admin_{"security_admin"};
};

}  // namespace warden::protocol
