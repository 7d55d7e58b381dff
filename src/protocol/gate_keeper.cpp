#include <warden/execution/abi.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/protocol/gate_keeper.hpp>
#include <warden/protocol/signatures.hpp>

#include <tuple>
#include <vector>

using namespace warden::schema;
using warden::execution::call_frame;
using warden::execution::host;
using warden::execution::require;

namespace warden::protocol {

gate_keeper::gate_keeper(const address_t& self,
                         const bytes_view_t& constructor_args)
    : contract{self},
      router_{std::get<0>(
          execution::abi::decode_arguments<address_t>(constructor_args))} {
  require(!is_zero(router_), error_code::zero_address, "router");

  expose<address_t>(signatures::kPreRegister,
                    [this](host& runtime, const call_frame& frame,
                           const address_t& identity) {
                      ledger_.pre_register(runtime, frame, identity);
                    });

  expose<address_t, address_t>(
      signatures::kLedgerCompleteRegistration,
      [this](host& runtime, const call_frame& frame,
             const address_t& host_address, const address_t& identity) {
        require_router(frame);
        ledger_.complete_registration(runtime, frame, host_address, identity);
      });

  expose<address_t, std::vector<selector_t>, std::vector<bool>>(
      signatures::kUpdateFlags,
      [this](host& runtime, const call_frame& frame, const address_t& identity,
             const std::vector<selector_t>& selectors,
             const std::vector<bool>& flags) {
        ledger_.update_flags(runtime, frame, identity, selectors, flags);
      });

  expose<address_t, selector_t>(
      signatures::kQueryFlag,
      [this](host& runtime, const call_frame& frame, const address_t& identity,
             const selector_t& selector) {
        return static_cast<bool>(
            ledger_.query_flags(runtime, frame, identity, {selector}).front());
      });

  expose<address_t, std::vector<selector_t>>(
      signatures::kQueryFlags,
      [this](host& runtime, const call_frame& frame, const address_t& identity,
             const std::vector<selector_t>& selectors) {
        return ledger_.query_flags(runtime, frame, identity, selectors);
      });

  expose<address_t, address_t>(
      signatures::kPreAuthorizeUpgrade,
      [this](host& runtime, const call_frame& frame, const address_t& current,
             const address_t& next) {
        ledger_.pre_authorize_upgrade(runtime, frame, current, next);
      });

  expose<address_t, authorization_status_t>(
      signatures::kAdminOverrideAuthorization,
      [this](host& runtime, const call_frame& frame, const address_t& identity,
             const authorization_status_t status) {
        require_router(frame);
        ledger_.override_authorization(runtime, frame, identity, status);
      });

  expose<std::vector<address_t>, std::vector<authorization_status_t>>(
      signatures::kAdminOverrideAuthorizationBatch,
      [this](host& runtime, const call_frame& frame,
             const std::vector<address_t>& identities,
             const std::vector<authorization_status_t>& statuses) {
        require_router(frame);
        require(identities.size() == statuses.size(),
                error_code::array_length_mismatch);
        for (std::size_t i = 0; i < identities.size(); ++i) {
          ledger_.override_authorization(runtime, frame, identities[i],
                                         statuses[i]);
        }
      });

  expose<address_t, registration_status_t>(
      signatures::kAdminOverrideRegistration,
      [this](host& runtime, const call_frame& frame, const address_t& identity,
             const registration_status_t status) {
        require_router(frame);
        ledger_.override_registration(runtime, frame, identity, status);
      });

  expose<std::vector<address_t>, std::vector<registration_status_t>>(
      signatures::kAdminOverrideRegistrationBatch,
      [this](host& runtime, const call_frame& frame,
             const std::vector<address_t>& identities,
             const std::vector<registration_status_t>& statuses) {
        require_router(frame);
        require(identities.size() == statuses.size(),
                error_code::array_length_mismatch);
        for (std::size_t i = 0; i < identities.size(); ++i) {
          ledger_.override_registration(runtime, frame, identities[i],
                                        statuses[i]);
        }
      });

  expose<address_t>(signatures::kGetIntegrationRecord,
                    [this](host& runtime, const call_frame& frame,
                           const address_t& identity) {
                      return ledger_.record(runtime, frame, identity);
                    });

  expose<address_t>(signatures::kGetRegistrationStatus,
                    [this](host& runtime, const call_frame& frame,
                           const address_t& identity) {
                      return ledger_.record(runtime, frame, identity)
                          .registration;
                    });

  expose<address_t>(signatures::kGetAuthorizationStatus,
                    [this](host& runtime, const call_frame& frame,
                           const address_t& identity) {
                      return ledger_.record(runtime, frame, identity)
                          .authorization;
                    });

  expose(signatures::kRouter,
         [this](host&, const call_frame&) { return router_; });
}

void gate_keeper::require_router(const call_frame& frame) const {
  require(frame.sender == router_, error_code::caller_not_router,
          to_hex(frame.sender));
}

}  // namespace warden::protocol
