#pragma once

#include <warden/execution/call_frame.hpp>
#include <warden/schema/authorization_status.hpp>
#include <warden/schema/integration_record.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/registration_status.hpp>

#include <vector>

namespace warden::execution {
class host;
}

namespace warden::protocol {

/// Registration, authorization and protection-flag state of every
/// integration, keyed by self-identity and held in the GateKeeper's storage.
///
/// Transitions are enforced here rather than by callers:
///   unregistered -> pending      pre_register (self-authenticated)
///   pending -> registered        complete_registration (router)
///   any -> any                   override_* (router, protocol admin)
/// `active` authorization is only set together with `registered`.
class status_ledger final {
 public:
  warden::schema::integration_record_t record(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const warden::schema::address_t& identity) const;

  bool flag(warden::execution::host& runtime,
            const warden::execution::call_frame& frame,
            const warden::schema::address_t& identity,
            const warden::schema::selector_t& selector) const;

  /// Fails with CallerNotIntegration unless the calling logic is `identity`
  /// running behind the record's bound host.
  void authenticate(warden::execution::host& runtime,
                    const warden::execution::call_frame& frame,
                    const warden::schema::address_t& identity) const;

  /// Bind the caller as host on first use and move to pending. A registered
  /// identity keeps its status and no event is emitted.
  void pre_register(warden::execution::host& runtime,
                    const warden::execution::call_frame& frame,
                    const warden::schema::address_t& identity) const;

  void complete_registration(warden::execution::host& runtime,
                             const warden::execution::call_frame& frame,
                             const warden::schema::address_t& host_address,
                             const warden::schema::address_t& identity) const;

  void update_flags(warden::execution::host& runtime,
                    const warden::execution::call_frame& frame,
                    const warden::schema::address_t& identity,
                    const std::vector<warden::schema::selector_t>& selectors,
                    const std::vector<bool>& flags) const;

  /// Fails with IntegrationNotRegistered for an unregistered identity.
  std::vector<bool> query_flags(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const warden::schema::address_t& identity,
      const std::vector<warden::schema::selector_t>& selectors) const;

  void pre_authorize_upgrade(warden::execution::host& runtime,
                             const warden::execution::call_frame& frame,
                             const warden::schema::address_t& current,
                             const warden::schema::address_t& next) const;

  void override_authorization(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const warden::schema::address_t& identity,
      warden::schema::authorization_status_t status) const;

  void override_registration(warden::execution::host& runtime,
                             const warden::execution::call_frame& frame,
                             const warden::schema::address_t& identity,
                             warden::schema::registration_status_t status) const;

 private:
  void write_record(warden::execution::host& runtime,
                    const warden::execution::call_frame& frame,
                    const warden::schema::address_t& identity,
                    const warden::schema::integration_record_t& record) const;
  void set_registration(warden::execution::host& runtime,
                        const warden::execution::call_frame& frame,
                        const warden::schema::address_t& identity,
                        warden::schema::integration_record_t& record,
                        warden::schema::registration_status_t status) const;
  void set_authorization(warden::execution::host& runtime,
                         const warden::execution::call_frame& frame,
                         const warden::schema::address_t& identity,
                         warden::schema::integration_record_t& record,
                         warden::schema::authorization_status_t status) const;
};

}  // namespace warden::protocol
