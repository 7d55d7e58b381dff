#include <spdlog/spdlog.h>
#include <warden/execution/abi.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/protocol/integration.hpp>
#include <warden/protocol/router.hpp>
#include <warden/protocol/signatures.hpp>

#include <algorithm>
#include <exception>
#include <iterator>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace warden::schema;
using warden::execution::call_frame;
using warden::execution::host;
using warden::execution::protocol_error;
using warden::execution::require;

namespace warden::protocol {

namespace abi = warden::execution::abi;

integration::integration(const address_t& self,
                         const bytes_view_t& constructor_args)
    : contract{self} {
  std::tie(router_, gate_keeper_) =
      abi::decode_arguments<address_t, address_t>(constructor_args);
  require(!is_zero(router_), error_code::zero_address, "router");
  require(!is_zero(gate_keeper_), error_code::zero_address, "gate keeper");

  expose(signatures::kSecurityAdmin,
         [this](host& runtime, const call_frame& frame) {
           return security_admin_.admin(runtime, frame);
         });
  expose(signatures::kPendingSecurityAdmin,
         [this](host& runtime, const call_frame& frame) {
           return security_admin_.pending_admin(runtime, frame);
         });
  expose<address_t>(signatures::kTransferSecurityAdministration,
                    [this](host& runtime, const call_frame& frame,
                           const address_t& new_admin) {
                      security_admin_.transfer(runtime, frame, new_admin);
                    });
  expose(signatures::kAcceptSecurityAdministration,
         [this](host& runtime, const call_frame& frame) {
           security_admin_.accept(runtime, frame);
         });

  expose<bytes_t, std::vector<selector_t>>(
      signatures::kRegisterWithDefaults,
      [this](host& runtime, const call_frame& frame, const bytes_t& credential,
             const std::vector<selector_t>& selectors) {
        register_with_defaults(runtime, frame, credential, selectors);
      });

  expose<std::vector<selector_t>, std::vector<bool>>(
      signatures::kSetFunctionProtectionStatus,
      [this](host& runtime, const call_frame& frame,
             const std::vector<selector_t>& selectors,
             const std::vector<bool>& flags) {
        require(selectors.size() == flags.size(),
                error_code::array_length_mismatch);
        security_admin_.require_admin(runtime, frame);
        write_protection(runtime, frame, selectors, flags);
      });

  expose<selector_t>(signatures::kIsFunctionProtectionEnabled,
                     [this](host& runtime, const call_frame& frame,
                            const selector_t& selector) {
                       return protection_enabled(runtime, frame, selector);
                     });

  expose<std::vector<selector_t>>(
      signatures::kAreFunctionsProtected,
      [this](host& runtime, const call_frame& frame,
             const std::vector<selector_t>& selectors) {
        return protection_status(runtime, frame, selectors);
      });

  expose(signatures::kIntegrationSelf,
         [this](host&, const call_frame& frame) {
           return std::tuple{frame.self, this->self()};
         });
  expose(signatures::kIntegrationRouter,
         [this](host&, const call_frame&) { return router_; });
  expose(signatures::kIntegrationGateKeeper,
         [this](host&, const call_frame&) { return gate_keeper_; });
}

void integration::guard(host& runtime,
                        const call_frame& frame,
                        const bytes_t& payload) const {
  check_identity(runtime, frame);

  auto selector =
      abi::selector_of(bytes_view_t{frame.data.data(), frame.data.size()});
  require(selector.has_value(), error_code::invalid_calldata);
  if (!protection_enabled(runtime, frame, *selector)) {
    return;
  }
  require(payload.size() >= kMinimumPayloadSize, error_code::payload_too_short,
          "payload length " + std::to_string(payload.size()));
  require(frame.data.size() >= payload.size() &&
              std::equal(std::rbegin(payload), std::rend(payload),
                         std::rbegin(frame.data)),
          error_code::invalid_calldata, "payload is not the call data tail");

  auto verdict = std::optional<bool>{};
  try {
    verdict = abi::try_decode_result<bool>(runtime.call(
        frame, router_, amount_t{},
        abi::encode_call(signatures::kDispatchProtectedCall, frame.sender,
                         self(), make_word(frame.value),
                         static_cast<uint64_t>(payload.size()), frame.data)));
  } catch (const protocol_error&) {
    throw;
  } catch (const std::exception& e) {
    spdlog::warn("Protected call dispatch for {} failed: {}", to_hex(self()),
                 e.what());
    throw protocol_error{error_code::dispatch_failed, e.what()};
  }
  require(verdict.has_value(), error_code::dispatch_failed,
          "router returned a malformed verdict");
  require(*verdict, error_code::module_denied, to_hex(*selector));
}

void integration::pre_register(host& runtime, const call_frame& frame) const {
  runtime.call(frame, gate_keeper_, amount_t{},
               abi::encode_call(signatures::kPreRegister, self()));
}

void integration::register_with_defaults(
    host& runtime,
    const call_frame& frame,
    const bytes_t& credential,
    const std::vector<selector_t>& selectors) const {
  security_admin_.require_admin(runtime, frame);
  auto completed = abi::decode_result<bool>(runtime.call(
      frame, router_, amount_t{},
      abi::encode_call(signatures::kRouterCompleteRegistration, self(),
                       frame.sender, credential)));
  require(completed, error_code::registration_failed, to_hex(self()));
  if (!selectors.empty()) {
    write_protection(runtime, frame, selectors,
                     std::vector<bool>(selectors.size(), true));
  }
  spdlog::info("Integration {} registered behind {}", to_hex(self()),
               to_hex(frame.self));
}

}  // namespace warden::protocol
