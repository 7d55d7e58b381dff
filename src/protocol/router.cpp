#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/execution/abi.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/protocol/events.hpp>
#include <warden/protocol/router.hpp>
#include <warden/protocol/signatures.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <tuple>
#include <vector>

using namespace warden::schema;
using warden::execution::call_frame;
using warden::execution::host;
using warden::execution::require;

namespace warden::protocol {

namespace {

namespace abi = warden::execution::abi;

const auto kInitializedSlot = abi::make_slot("initialized");
const auto kGateKeeperSlot = abi::make_slot("gate_keeper");
const auto kRegistrarKeySlot = abi::make_slot("registrar_key");
const auto kPausedSlot = abi::make_slot("paused");

bytes_t role_slot(const role_id_t role, const address_t& account) {
  return abi::make_slot("role", role, account);
}

bytes_t module_slot(const module_id_t& id) {
  return abi::make_slot("module", id);
}

}  // namespace

hash32_t make_registration_message(const hash32_t& chain_id,
                                   const address_t& host,
                                   const address_t& identity,
                                   const address_t& admin) {
  auto encoder = abi::encoder_t{};
  auto material = encoder.encode(
      std::tuple{std::string_view{"warden-registration-v1"}, chain_id, host,
                 identity, admin});
  return warden::blake3::hash(bytes_view_t{material.data(), material.size()});
}

module_id_t make_module_id(const std::string_view version) {
  auto encoder = abi::encoder_t{};
  auto encoded = encoder.encode(version);
  return warden::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

router::router(const address_t& self, const bytes_view_t& constructor_args)
    : contract{self} {
  require(constructor_args.empty(), error_code::invalid_calldata,
          "router takes no constructor arguments");

  expose<address_t, registrar_key_t, address_t>(
      signatures::kRouterInitialize,
      [this](host& runtime, const call_frame& frame, const address_t& admin,
             const registrar_key_t& registrar_key,
             const address_t& gate_keeper) {
        require(!runtime.load_as<bool>(frame, kInitializedSlot).value_or(false),
                error_code::already_initialized);
        require(!is_zero(gate_keeper), error_code::zero_address,
                "gate keeper");
        protocol_admin_.initialize(runtime, frame, admin);
        runtime.store_as(frame, kInitializedSlot, true);
        runtime.store_as(frame, kGateKeeperSlot, gate_keeper);
        runtime.store_as(frame, kRegistrarKeySlot, registrar_key);
        runtime.emit(frame,
                     events::make_event(
                         events::kRouterInitialized,
                         {events::attribute("admin", to_hex(admin), true),
                          events::attribute("gate_keeper",
                                            to_hex(gate_keeper))}));
      });

  expose<address_t, address_t, bytes_t>(
      signatures::kRouterCompleteRegistration,
      [this](host& runtime, const call_frame& frame, const address_t& identity,
             const address_t& admin, const bytes_t& credential) {
        return complete_registration(runtime, frame, identity, admin,
                                     credential);
      });

  expose<address_t, address_t, word_t, uint64_t, bytes_t>(
      signatures::kDispatchProtectedCall,
      [this](host& runtime, const call_frame& frame, const address_t& caller,
             const address_t& target_self, const word_t& value,
             const uint64_t payload_length, const bytes_t& data) {
        return dispatch_protected_call(runtime, frame, caller, target_self,
                                       value, payload_length, data);
      });

  expose(signatures::kProtocolAdmin,
         [this](host& runtime, const call_frame& frame) {
           return protocol_admin_.admin(runtime, frame);
         });
  expose(signatures::kPendingProtocolAdmin,
         [this](host& runtime, const call_frame& frame) {
           return protocol_admin_.pending_admin(runtime, frame);
         });
  expose<address_t>(signatures::kTransferProtocolAdministration,
                    [this](host& runtime, const call_frame& frame,
                           const address_t& new_admin) {
                      protocol_admin_.transfer(runtime, frame, new_admin);
                    });
  expose(signatures::kAcceptProtocolAdministration,
         [this](host& runtime, const call_frame& frame) {
           protocol_admin_.accept(runtime, frame);
         });

  expose<role_id_t, address_t>(
      signatures::kGrantRole,
      [this](host& runtime, const call_frame& frame, const role_id_t role,
             const address_t& account) {
        protocol_admin_.require_admin(runtime, frame);
        require(role == role_id_t::integration_admin,
                error_code::invalid_calldata,
                "protocol admin changes through the two-step transfer");
        require(!is_zero(account), error_code::zero_address, "role account");
        runtime.store_as(frame, role_slot(role, account), true);
        runtime.emit(frame, events::make_event(
                                events::kRoleChanged,
                                {events::attribute("role",
                                                   std::string{to_string(role)}),
                                 events::attribute("account", to_hex(account),
                                                   true),
                                 events::attribute("granted", "true")}));
      });

  expose<role_id_t, address_t>(
      signatures::kRevokeRole,
      [this](host& runtime, const call_frame& frame, const role_id_t role,
             const address_t& account) {
        protocol_admin_.require_admin(runtime, frame);
        require(role == role_id_t::integration_admin,
                error_code::invalid_calldata,
                "protocol admin changes through the two-step transfer");
        runtime.erase(frame, role_slot(role, account));
        runtime.emit(frame, events::make_event(
                                events::kRoleChanged,
                                {events::attribute("role",
                                                   std::string{to_string(role)}),
                                 events::attribute("account", to_hex(account),
                                                   true),
                                 events::attribute("granted", "false")}));
      });

  expose<role_id_t, address_t>(
      signatures::kHasRole,
      [this](host& runtime, const call_frame& frame, const role_id_t role,
             const address_t& account) {
        return has_role(runtime, frame, role, account);
      });

  expose<address_t, std::string>(
      signatures::kInstallModule,
      [this](host& runtime, const call_frame& frame, const address_t& module,
             const std::string& version) {
        protocol_admin_.require_admin(runtime, frame);
        require(!is_zero(module), error_code::zero_address, "module");
        require(runtime.account(module).has_value(),
                error_code::account_missing, to_hex(module));
        auto id = make_module_id(version);
        require(!this->module(runtime, frame, id).has_value(),
                error_code::module_already_installed, version);
        runtime.store_as(frame, module_slot(id),
                         module_record_t{.module = module,
                                         .module_version = version,
                                         .deprecated = false});
        runtime.emit(frame, events::make_event(
                                events::kModuleInstalled,
                                {events::attribute(
                                     "module_id",
                                     to_hex(bytes_view_t{id.data(), id.size()}),
                                     true),
                                 events::attribute("module", to_hex(module)),
                                 events::attribute("version", version)}));
        spdlog::info("Installed security module {} version '{}'",
                     to_hex(module), version);
        return id;
      });

  expose<module_id_t>(
      signatures::kDeprecateModule,
      [this](host& runtime, const call_frame& frame, const module_id_t& id) {
        protocol_admin_.require_admin(runtime, frame);
        auto record = this->module(runtime, frame, id);
        require(record.has_value(), error_code::module_not_installed,
                to_hex(bytes_view_t{id.data(), id.size()}));
        record->deprecated = true;
        runtime.store_as(frame, module_slot(id), *record);
        runtime.emit(frame, events::make_event(
                                events::kModuleDeprecated,
                                {events::attribute(
                                     "module_id",
                                     to_hex(bytes_view_t{id.data(), id.size()}),
                                     true),
                                 events::attribute("module",
                                                   to_hex(record->module))}));
      });

  expose<module_id_t>(
      signatures::kGetModule,
      [this](host& runtime, const call_frame& frame, const module_id_t& id) {
        auto record = this->module(runtime, frame, id);
        require(record.has_value(), error_code::module_not_installed,
                to_hex(bytes_view_t{id.data(), id.size()}));
        return *record;
      });

  expose<registrar_key_t>(
      signatures::kSetRegistrarKey,
      [this](host& runtime, const call_frame& frame,
             const registrar_key_t& registrar_key) {
        protocol_admin_.require_admin(runtime, frame);
        runtime.store_as(frame, kRegistrarKeySlot, registrar_key);
        runtime.emit(
            frame,
            events::make_event(
                events::kRegistrarKeyChanged,
                {events::attribute("registrar_key",
                                   to_hex(bytes_view_t{registrar_key.data(),
                                                       registrar_key.size()}))}));
      });

  expose(signatures::kRegistrarKey,
         [](host& runtime, const call_frame& frame) {
           return runtime.load_as<registrar_key_t>(frame, kRegistrarKeySlot)
               .value_or(registrar_key_t{});
         });

  expose<bool>(signatures::kSetPaused,
               [this](host& runtime, const call_frame& frame,
                      const bool paused) {
                 protocol_admin_.require_admin(runtime, frame);
                 runtime.store_as(frame, kPausedSlot, paused);
                 runtime.emit(frame,
                              events::make_event(
                                  events::kPausedChanged,
                                  {events::attribute(
                                      "paused", paused ? "true" : "false")}));
                 spdlog::warn("Protected-call dispatch {}",
                              paused ? "paused" : "resumed");
               });

  expose(signatures::kPaused, [](host& runtime, const call_frame& frame) {
    return runtime.load_as<bool>(frame, kPausedSlot).value_or(false);
  });

  expose(signatures::kGateKeeper,
         [this](host& runtime, const call_frame& frame) {
           return gate_keeper_address(runtime, frame);
         });

  expose<address_t, authorization_status_t>(
      signatures::kSetIntegrationAuthorizationStatus,
      [this](host& runtime, const call_frame& frame, const address_t& identity,
             const authorization_status_t status) {
        require_integration_admin(runtime, frame);
        forward_override(runtime, frame,
                         abi::encode_call(signatures::kAdminOverrideAuthorization,
                                          identity, status));
      });

  expose<std::vector<address_t>, std::vector<authorization_status_t>>(
      signatures::kSetIntegrationAuthorizationStatusBatch,
      [this](host& runtime, const call_frame& frame,
             const std::vector<address_t>& identities,
             const std::vector<authorization_status_t>& statuses) {
        require_integration_admin(runtime, frame);
        require(identities.size() == statuses.size(),
                error_code::array_length_mismatch);
        forward_override(
            runtime, frame,
            abi::encode_call(signatures::kAdminOverrideAuthorizationBatch,
                             identities, statuses));
      });

  expose<address_t, registration_status_t>(
      signatures::kSetIntegrationRegistrationStatus,
      [this](host& runtime, const call_frame& frame, const address_t& identity,
             const registration_status_t status) {
        require_integration_admin(runtime, frame);
        forward_override(runtime, frame,
                         abi::encode_call(signatures::kAdminOverrideRegistration,
                                          identity, status));
      });

  expose<std::vector<address_t>, std::vector<registration_status_t>>(
      signatures::kSetIntegrationRegistrationStatusBatch,
      [this](host& runtime, const call_frame& frame,
             const std::vector<address_t>& identities,
             const std::vector<registration_status_t>& statuses) {
        require_integration_admin(runtime, frame);
        require(identities.size() == statuses.size(),
                error_code::array_length_mismatch);
        forward_override(
            runtime, frame,
            abi::encode_call(signatures::kAdminOverrideRegistrationBatch,
                             identities, statuses));
      });
}

bool router::complete_registration(host& runtime,
                                   const call_frame& frame,
                                   const address_t& identity,
                                   const address_t& admin,
                                   const bytes_t& credential) const {
  require_initialized(runtime, frame);
  require(frame.sender_code == identity, error_code::caller_not_integration,
          to_hex(frame.sender_code));
  require(credential.size() == kRegistrarSignatureSize,
          error_code::invalid_credential_length,
          "expected 65 bytes, got " + std::to_string(credential.size()));

  auto registrar_key =
      runtime.load_as<registrar_key_t>(frame, kRegistrarKeySlot)
          .value_or(registrar_key_t{});
  auto signature = registrar_signature_t{};
  std::copy(std::begin(credential), std::end(credential),
            std::begin(signature));
  auto message =
      make_registration_message(runtime.chain_id(), frame.sender, identity,
                                admin);
  require(runtime.verify_registrar_signature(
              bytes_view_t{message.data(), message.size()}, registrar_key,
              signature),
          error_code::registration_failed, to_hex(identity));

  runtime.call(frame, gate_keeper_address(runtime, frame), amount_t{},
               abi::encode_call(signatures::kLedgerCompleteRegistration,
                                frame.sender, identity));
  return true;
}

bool router::dispatch_protected_call(host& runtime,
                                     const call_frame& frame,
                                     const address_t& caller,
                                     const address_t& target_self,
                                     const word_t& value,
                                     const uint64_t payload_length,
                                     const bytes_t& data) const {
  require_initialized(runtime, frame);
  require(frame.sender_code == target_self, error_code::caller_not_integration,
          to_hex(frame.sender_code));
  auto status = abi::decode_result<authorization_status_t>(runtime.static_call(
      frame, gate_keeper_address(runtime, frame),
      abi::encode_call(signatures::kGetAuthorizationStatus, target_self)));
  switch (status) {
    case authorization_status_t::bypassed:
      return true;
    case authorization_status_t::revoked:
      throw execution::protocol_error{error_code::integration_revoked,
                                      to_hex(target_self)};
    case authorization_status_t::inactive:
      throw execution::protocol_error{error_code::integration_not_active,
                                      to_hex(target_self)};
    case authorization_status_t::active:
      break;
  }
  // Pausing skips the module, never the status checks above.
  if (runtime.load_as<bool>(frame, kPausedSlot).value_or(false)) {
    return true;
  }

  require(payload_length >= kMinimumPayloadSize && payload_length <= data.size(),
          error_code::payload_too_short,
          "payload length " + std::to_string(payload_length));
  auto split = std::end(data) - static_cast<std::ptrdiff_t>(payload_length);
  auto payload = bytes_t{split, std::end(data)};
  auto invocation = warden::blake3::hash(
      bytes_view_t{data.data(), data.size() - payload_length});

  auto marker = abi::selector_of(bytes_view_t{payload.data(), payload.size()});
  auto id = module_id_t{};
  std::copy_n(std::begin(payload) + abi::kSelectorSize, id.size(),
              std::begin(id));

  auto record = module(runtime, frame, id);
  require(record.has_value(), error_code::module_not_installed,
          to_hex(bytes_view_t{id.data(), id.size()}));
  require(!record->deprecated, error_code::module_deprecated,
          record->module_version);

  auto verdict = abi::try_decode_result<bool>(runtime.call(
      frame, record->module, amount_t{},
      abi::encode_call(*marker, caller, target_self, value, invocation,
                       payload)));
  require(verdict.has_value(), error_code::dispatch_failed,
          "module returned a malformed verdict");
  return *verdict;
}

address_t router::gate_keeper_address(host& runtime,
                                      const call_frame& frame) const {
  return runtime.load_as<address_t>(frame, kGateKeeperSlot)
      .value_or(make_zero_address());
}

std::optional<module_record_t> router::module(host& runtime,
                                              const call_frame& frame,
                                              const module_id_t& id) const {
  return runtime.load_as<module_record_t>(frame, module_slot(id));
}

bool router::has_role(host& runtime,
                      const call_frame& frame,
                      const role_id_t role,
                      const address_t& account) const {
  if (role == role_id_t::protocol_admin) {
    return protocol_admin_.is_admin(runtime, frame, account);
  }
  return runtime.load_as<bool>(frame, role_slot(role, account)).value_or(false);
}

void router::require_initialized(host& runtime,
                                 const call_frame& frame) const {
  require(runtime.load_as<bool>(frame, kInitializedSlot).value_or(false),
          error_code::not_initialized, "router");
}

void router::require_integration_admin(host& runtime,
                                       const call_frame& frame) const {
  require(has_role(runtime, frame, role_id_t::protocol_admin, frame.sender) ||
              has_role(runtime, frame, role_id_t::integration_admin,
                       frame.sender),
          error_code::caller_not_integration_admin, to_hex(frame.sender));
}

void router::forward_override(host& runtime,
                              const call_frame& frame,
                              const bytes_t& call_data) const {
  require_initialized(runtime, frame);
  runtime.call(frame, gate_keeper_address(runtime, frame), amount_t{},
               call_data);
}

}  // namespace warden::protocol
