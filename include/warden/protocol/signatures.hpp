#pragma once

#include <string_view>

// Entry point signatures of the protocol contracts. Selectors are derived from
// these strings with execution::abi::make_selector.
namespace warden::protocol::signatures {

// GateKeeper.
inline constexpr std::string_view kPreRegister{"preRegister(address)"};
inline constexpr std::string_view kLedgerCompleteRegistration{
    "completeRegistration(address,address)"};
inline constexpr std::string_view kUpdateFlags{
    "updateFlags(address,bytes4[],bool[])"};
inline constexpr std::string_view kQueryFlag{"queryFlag(address,bytes4)"};
inline constexpr std::string_view kQueryFlags{"queryFlags(address,bytes4[])"};
inline constexpr std::string_view kPreAuthorizeUpgrade{
    "preAuthorizeUpgrade(address,address)"};
inline constexpr std::string_view kAdminOverrideAuthorization{
    "adminOverrideAuthorization(address,uint8)"};
inline constexpr std::string_view kAdminOverrideAuthorizationBatch{
    "adminOverrideAuthorizationBatch(address[],uint8[])"};
inline constexpr std::string_view kAdminOverrideRegistration{
    "adminOverrideRegistration(address,uint8)"};
inline constexpr std::string_view kAdminOverrideRegistrationBatch{
    "adminOverrideRegistrationBatch(address[],uint8[])"};
inline constexpr std::string_view kGetIntegrationRecord{
    "getIntegrationRecord(address)"};
inline constexpr std::string_view kGetRegistrationStatus{
    "getRegistrationStatus(address)"};
inline constexpr std::string_view kGetAuthorizationStatus{
    "getAuthorizationStatus(address)"};
inline constexpr std::string_view kRouter{"router()"};

// Router.
inline constexpr std::string_view kRouterInitialize{
    "initialize(address,bytes33,address)"};
inline constexpr std::string_view kRouterCompleteRegistration{
    "completeRegistration(address,address,bytes)"};
inline constexpr std::string_view kDispatchProtectedCall{
    "dispatchProtectedCall(address,address,uint256,uint64,bytes)"};
inline constexpr std::string_view kProtocolAdmin{"protocolAdmin()"};
inline constexpr std::string_view kPendingProtocolAdmin{
    "pendingProtocolAdmin()"};
inline constexpr std::string_view kTransferProtocolAdministration{
    "transferProtocolAdministration(address)"};
inline constexpr std::string_view kAcceptProtocolAdministration{
    "acceptProtocolAdministration()"};
inline constexpr std::string_view kGrantRole{"grantRole(uint8,address)"};
inline constexpr std::string_view kRevokeRole{"revokeRole(uint8,address)"};
inline constexpr std::string_view kHasRole{"hasRole(uint8,address)"};
inline constexpr std::string_view kInstallModule{
    "installModule(address,string)"};
inline constexpr std::string_view kDeprecateModule{"deprecateModule(bytes32)"};
inline constexpr std::string_view kGetModule{"getModule(bytes32)"};
inline constexpr std::string_view kSetRegistrarKey{"setRegistrarKey(bytes33)"};
inline constexpr std::string_view kRegistrarKey{"registrarKey()"};
inline constexpr std::string_view kSetPaused{"setPaused(bool)"};
inline constexpr std::string_view kPaused{"paused()"};
inline constexpr std::string_view kGateKeeper{"gateKeeper()"};
inline constexpr std::string_view kSetIntegrationAuthorizationStatus{
    "setIntegrationAuthorizationStatus(address,uint8)"};
inline constexpr std::string_view kSetIntegrationAuthorizationStatusBatch{
    "setIntegrationAuthorizationStatusBatch(address[],uint8[])"};
inline constexpr std::string_view kSetIntegrationRegistrationStatus{
    "setIntegrationRegistrationStatus(address,uint8)"};
inline constexpr std::string_view kSetIntegrationRegistrationStatusBatch{
    "setIntegrationRegistrationStatusBatch(address[],uint8[])"};

// Integration.
inline constexpr std::string_view kSecurityAdmin{"securityAdmin()"};
inline constexpr std::string_view kPendingSecurityAdmin{
    "pendingSecurityAdmin()"};
inline constexpr std::string_view kTransferSecurityAdministration{
    "transferSecurityAdministration(address)"};
inline constexpr std::string_view kAcceptSecurityAdministration{
    "acceptSecurityAdministration()"};
inline constexpr std::string_view kRegisterWithDefaults{
    "registerWithDefaults(bytes,bytes4[])"};
inline constexpr std::string_view kSetFunctionProtectionStatus{
    "setFunctionProtectionStatus(bytes4[],bool[])"};
inline constexpr std::string_view kIsFunctionProtectionEnabled{
    "isFunctionProtectionEnabled(bytes4)"};
inline constexpr std::string_view kAreFunctionsProtected{
    "areFunctionsProtected(bytes4[])"};
inline constexpr std::string_view kIntegrationSelf{"integrationSelf()"};
inline constexpr std::string_view kIntegrationRouter{"integrationRouter()"};
inline constexpr std::string_view kIntegrationGateKeeper{
    "integrationGateKeeper()"};
inline constexpr std::string_view kInitializeIntegration{"initialize(address)"};
inline constexpr std::string_view kPreAuthorizeNewImplementation{
    "preAuthorizeNewImplementation(address)"};
inline constexpr std::string_view kRegisterUpgradedImplementation{
    "registerUpgradedImplementation()"};

// Security module entry point; its selector is the payload marker.
inline constexpr std::string_view kValidate{
    "validate(address,address,uint256,bytes32,bytes)"};

}  // namespace warden::protocol::signatures
