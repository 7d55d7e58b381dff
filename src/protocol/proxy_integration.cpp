#include <spdlog/spdlog.h>
#include <warden/execution/abi.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/protocol/proxy_integration.hpp>
#include <warden/protocol/signatures.hpp>

#include <vector>

using namespace warden::schema;
using warden::execution::call_frame;
using warden::execution::host;
using warden::execution::require;

namespace warden::protocol {

namespace abi = warden::execution::abi;

namespace {

const auto kInitializedSlot = abi::make_slot("integration_initialized");

}  // namespace

proxy_integration::proxy_integration(const address_t& self,
                                     const bytes_view_t& constructor_args)
    : integration{self, constructor_args} {
  expose<address_t>(
      signatures::kInitializeIntegration,
      [this](host& runtime, const call_frame& frame, const address_t& admin) {
        check_identity(runtime, frame);
        require(
            !runtime.load_as<bool>(frame, kInitializedSlot).value_or(false),
            error_code::already_initialized);
        security_admin().initialize(runtime, frame, admin);
        runtime.store_as(frame, kInitializedSlot, true);
        pre_register(runtime, frame);
      });

  expose<address_t>(
      signatures::kPreAuthorizeNewImplementation,
      [this](host& runtime, const call_frame& frame,
             const address_t& next_identity) {
        check_identity(runtime, frame);
        security_admin().require_admin(runtime, frame);
        runtime.call(frame, gate_keeper_address(), amount_t{},
                     abi::encode_call(signatures::kPreAuthorizeUpgrade,
                                      this->self(), next_identity));
      });

  expose(signatures::kRegisterUpgradedImplementation,
         [this](host& runtime, const call_frame& frame) {
           check_identity(runtime, frame);
           security_admin().require_admin(runtime, frame);
           pre_register(runtime, frame);
           spdlog::info("Proxy {} pre-registered upgraded logic {}",
                        to_hex(frame.self), to_hex(this->self()));
         });
}

void proxy_integration::check_identity(host& runtime,
                                       const call_frame& frame) const {
  auto implementation = runtime.implementation_of(frame.self);
  require(implementation.has_value() && *implementation == self(),
          error_code::delegation_not_permitted, to_hex(frame.self));
}

bool proxy_integration::protection_enabled(host& runtime,
                                           const call_frame& frame,
                                           const selector_t& selector) const {
  return abi::decode_result<bool>(runtime.static_call(
      frame, gate_keeper_address(),
      abi::encode_call(signatures::kQueryFlag, self(), selector)));
}

std::vector<bool> proxy_integration::protection_status(
    host& runtime,
    const call_frame& frame,
    const std::vector<selector_t>& selectors) const {
  return abi::decode_result<std::vector<bool>>(runtime.static_call(
      frame, gate_keeper_address(),
      abi::encode_call(signatures::kQueryFlags, self(), selectors)));
}

void proxy_integration::write_protection(
    host& runtime,
    const call_frame& frame,
    const std::vector<selector_t>& selectors,
    const std::vector<bool>& flags) const {
  check_identity(runtime, frame);
  runtime.call(frame, gate_keeper_address(), amount_t{},
               abi::encode_call(signatures::kUpdateFlags, self(), selectors,
                                flags));
}

}  // namespace warden::protocol
