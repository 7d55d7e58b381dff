#pragma once

#include <warden/execution/contract.hpp>
#include <warden/schema/primitives.hpp>

namespace warden::protocol {

/// Base of security module contracts.
///
/// The router calls `validate(caller, target_self, value, invocation, payload)`
/// and expects a SCALE bool verdict. `invocation` is the BLAKE3 digest of the
/// guarded call data without its trailing payload, so a verdict can be bound
/// to the operation and its arguments. Failing the call aborts the guarded
/// operation with the module's own reason.
class security_module : public warden::execution::contract {
 public:
  explicit security_module(const warden::schema::address_t& self);

 protected:
  virtual bool validate(warden::execution::host& runtime,
                        const warden::execution::call_frame& frame,
                        const warden::schema::address_t& caller,
                        const warden::schema::address_t& target_self,
                        const warden::schema::amount_t& value,
                        const warden::schema::hash32_t& invocation,
                        const warden::schema::bytes_t& payload) const = 0;
};

/// Payload addressed to the module installed under `id`:
/// marker ++ id ++ body, zero-padded to the minimum payload size.
warden::schema::bytes_t make_payload(const warden::schema::module_id_t& id,
                                     const warden::schema::bytes_view_t& body);

}  // namespace warden::protocol
