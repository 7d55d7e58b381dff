#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace warden::schema {

enum class error_code : uint32_t {
  ok = 0,
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_query = 5,
  account_missing = 10,
  account_exists = 11,
  code_missing = 12,
  function_not_found = 13,
  invalid_calldata = 14,
  static_call_violation = 15,
  not_a_proxy = 16,
  caller_not_proxy_admin = 17,
  call_depth_exceeded = 18,
  zero_address = 20,
  already_initialized = 21,
  caller_not_admin = 22,
  not_pending_admin = 23,
  not_initialized = 24,
  caller_not_integration = 30,
  caller_not_router = 31,
  integration_host_mismatch = 32,
  not_registered_pending = 33,
  integration_not_registered = 34,
  array_length_mismatch = 35,
  only_distinct_implementation = 36,
  invalid_credential_length = 40,
  registration_failed = 41,
  caller_not_integration_admin = 42,
  module_not_installed = 43,
  module_deprecated = 44,
  module_already_installed = 45,
  integration_revoked = 46,
  integration_not_active = 47,
  delegation_not_permitted = 50,
  payload_too_short = 51,
  module_denied = 52,
  dispatch_failed = 53,
};

using error_code_mapping_t = std::pair<std::string_view, error_code>;

inline constexpr auto kErrorCodeMappings = std::array{
    error_code_mapping_t{"Ok", error_code::ok},
    error_code_mapping_t{"InvalidTransaction", error_code::invalid_transaction},
    error_code_mapping_t{"UnsupportedTransactionVersion",
                         error_code::unsupported_transaction_version},
    error_code_mapping_t{"InvalidChainId", error_code::invalid_chain_id},
    error_code_mapping_t{"InvalidNonce", error_code::invalid_nonce},
    error_code_mapping_t{"InvalidQuery", error_code::invalid_query},
    error_code_mapping_t{"AccountMissing", error_code::account_missing},
    error_code_mapping_t{"AccountExists", error_code::account_exists},
    error_code_mapping_t{"CodeMissing", error_code::code_missing},
    error_code_mapping_t{"FunctionNotFound", error_code::function_not_found},
    error_code_mapping_t{"InvalidCalldata", error_code::invalid_calldata},
    error_code_mapping_t{"StaticCallViolation",
                         error_code::static_call_violation},
    error_code_mapping_t{"NotAProxy", error_code::not_a_proxy},
    error_code_mapping_t{"CallerNotProxyAdmin",
                         error_code::caller_not_proxy_admin},
    error_code_mapping_t{"CallDepthExceeded", error_code::call_depth_exceeded},
    error_code_mapping_t{"ZeroAddress", error_code::zero_address},
    error_code_mapping_t{"AlreadyInitialized", error_code::already_initialized},
    error_code_mapping_t{"CallerNotAdmin", error_code::caller_not_admin},
    error_code_mapping_t{"NotPendingAdmin", error_code::not_pending_admin},
    error_code_mapping_t{"NotInitialized", error_code::not_initialized},
    error_code_mapping_t{"CallerNotIntegration",
                         error_code::caller_not_integration},
    error_code_mapping_t{"CallerNotRouter", error_code::caller_not_router},
    error_code_mapping_t{"IntegrationHostMismatch",
                         error_code::integration_host_mismatch},
    error_code_mapping_t{"NotRegisteredPending",
                         error_code::not_registered_pending},
    error_code_mapping_t{"IntegrationNotRegistered",
                         error_code::integration_not_registered},
    error_code_mapping_t{"ArrayLengthMismatch",
                         error_code::array_length_mismatch},
    error_code_mapping_t{"OnlyDistinctImplementation",
                         error_code::only_distinct_implementation},
    error_code_mapping_t{"InvalidCredentialLength",
                         error_code::invalid_credential_length},
    error_code_mapping_t{"RegistrationFailed", error_code::registration_failed},
    error_code_mapping_t{"CallerNotIntegrationAdmin",
                         error_code::caller_not_integration_admin},
    error_code_mapping_t{"ModuleNotInstalled",
                         error_code::module_not_installed},
    error_code_mapping_t{"ModuleDeprecated", error_code::module_deprecated},
    error_code_mapping_t{"ModuleAlreadyInstalled",
                         error_code::module_already_installed},
    error_code_mapping_t{"IntegrationRevoked", error_code::integration_revoked},
    error_code_mapping_t{"IntegrationNotActive",
                         error_code::integration_not_active},
    error_code_mapping_t{"DelegationNotPermitted",
                         error_code::delegation_not_permitted},
    error_code_mapping_t{"PayloadTooShort", error_code::payload_too_short},
    error_code_mapping_t{"ModuleDenied", error_code::module_denied},
    error_code_mapping_t{"DispatchFailed", error_code::dispatch_failed},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("Unknown");
}

}  // namespace warden::schema
