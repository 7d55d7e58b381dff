#include <gtest/gtest.h>
#include <warden/execution/abi.hpp>
#include <warden/protocol/events.hpp>
#include <warden/protocol/signatures.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/integration_record.hpp>
#include <warden/testing/execution_fixture.hpp>
#include <warden/testing/mocks.hpp>

#include <cstdint>
#include <tuple>
#include <vector>

using namespace warden::schema;
namespace abi = warden::execution::abi;
namespace events = warden::protocol::events;
namespace signatures = warden::protocol::signatures;
using warden::testing::execution_fixture;
using warden::testing::kMintSelector;
using warden::testing::make_account;

namespace {

uint32_t code_of(const error_code code) {
  return static_cast<uint32_t>(code);
}

const auto kProtocolAdmin = make_account(0x01);
const auto kAdmin = make_account(0xA1);
const auto kUser = make_account(0xB1);

integration_record_t record_of(execution_fixture& fixture,
                               const address_t& identity) {
  return fixture.read<integration_record_t>(
      fixture.protocol().gate_keeper,
      abi::encode_call(signatures::kGetIntegrationRecord, identity));
}

bool ledger_flag(execution_fixture& fixture,
                 const address_t& identity,
                 const selector_t& selector) {
  return fixture.read<bool>(
      fixture.protocol().gate_keeper,
      abi::encode_call(signatures::kQueryFlag, identity, selector));
}

}  // namespace

TEST(proxy_integration, initialization_sets_explicit_admin_once) {
  auto fixture = execution_fixture{"warden_proxy_init"};
  fixture.deploy_protocol(kProtocolAdmin);
  auto logic = fixture.deploy(kUser, warden::testing::kProxyDemoCode,
                              fixture.integration_args());
  auto proxy = fixture.deploy_proxy(
      kUser, logic, kUser,
      abi::encode_call(signatures::kInitializeIntegration, kAdmin));
  ASSERT_FALSE(is_zero(proxy));

  EXPECT_EQ(fixture.read<address_t>(proxy,
                                    abi::encode_call(signatures::kSecurityAdmin)),
            kAdmin);
  auto identities = fixture.read<std::tuple<address_t, address_t>>(
      proxy, abi::encode_call(signatures::kIntegrationSelf));
  EXPECT_EQ(std::get<0>(identities), proxy);
  EXPECT_EQ(std::get<1>(identities), logic);

  auto record = record_of(fixture, logic);
  EXPECT_EQ(record.host, proxy);
  EXPECT_EQ(record.registration, registration_status_t::pending);

  EXPECT_EQ(fixture
                .call(kUser, proxy,
                      abi::encode_call(signatures::kInitializeIntegration,
                                       kUser))
                .code,
            code_of(error_code::already_initialized));
  EXPECT_EQ(fixture
                .call(kUser, logic,
                      abi::encode_call(signatures::kInitializeIntegration,
                                       kUser))
                .code,
            code_of(error_code::delegation_not_permitted));
  EXPECT_EQ(fixture
                .call(kUser, proxy,
                      abi::encode_call(signatures::kInitializeIntegration,
                                       make_zero_address()))
                .code,
            code_of(error_code::already_initialized));
}

TEST(proxy_integration, flags_live_in_the_ledger_under_logic_identity) {
  auto fixture = execution_fixture{"warden_proxy_flags"};
  fixture.deploy_protocol(kProtocolAdmin);
  auto id = fixture.install_mock_module(kProtocolAdmin, true);
  auto [logic, proxy] = fixture.deploy_proxied(kAdmin);

  auto registered =
      fixture.register_integration(kAdmin, proxy, {kMintSelector});
  ASSERT_EQ(registered.code, 0u) << registered.log << " " << registered.info;
  EXPECT_TRUE(ledger_flag(fixture, logic, kMintSelector));
  EXPECT_TRUE(fixture.read<bool>(
      proxy,
      abi::encode_call(signatures::kIsFunctionProtectionEnabled, kMintSelector)));
  EXPECT_EQ(fixture
                .view(fixture.protocol().gate_keeper,
                      abi::encode_call(signatures::kQueryFlag, proxy,
                                       kMintSelector))
                .code,
            code_of(error_code::integration_not_registered));

  auto minted = fixture.call(
      kUser, proxy,
      warden::testing::make_mint_call(4, fixture.make_payload(id)));
  ASSERT_EQ(minted.code, 0u) << minted.log << " " << minted.info;
  EXPECT_EQ(fixture.read<uint64_t>(proxy,
                                   abi::encode_call(warden::testing::kMinted)),
            4u);
  EXPECT_EQ(fixture.trace().target_self, logic);
  EXPECT_EQ(fixture.trace().caller, kUser);

  auto direct = fixture.call(
      kUser, logic,
      warden::testing::make_mint_call(4, fixture.make_payload(id)));
  EXPECT_EQ(direct.code, code_of(error_code::delegation_not_permitted));
}

TEST(proxy_integration, upgrade_requires_ledger_repair) {
  auto fixture = execution_fixture{"warden_proxy_upgrade"};
  fixture.deploy_protocol(kProtocolAdmin);
  auto id = fixture.install_mock_module(kProtocolAdmin, true);
  auto [logic, proxy] = fixture.deploy_proxied(kAdmin);
  ASSERT_EQ(fixture.register_integration(kAdmin, proxy, {kMintSelector}).code,
            0u);
  auto mint = [&, proxy = proxy] {
    return fixture.call(
        kUser, proxy,
        warden::testing::make_mint_call(1, fixture.make_payload(id)));
  };
  ASSERT_EQ(mint().code, 0u);

  auto next = fixture.deploy(kAdmin, warden::testing::kProxyDemoCode,
                             fixture.integration_args());
  auto authorized = fixture.call(
      kAdmin, proxy,
      abi::encode_call(signatures::kPreAuthorizeNewImplementation, next));
  ASSERT_EQ(authorized.code, 0u) << authorized.log << " " << authorized.info;
  EXPECT_EQ(authorized.events.front().type, events::kUpgradePreAuthorized);

  auto upgraded = fixture.submit(
      kAdmin, upgrade_proxy_t{.proxy = proxy, .implementation = next});
  ASSERT_EQ(upgraded.code, 0u) << upgraded.log << " " << upgraded.info;

  // The new logic identity has no ledger entry yet.
  EXPECT_EQ(mint().code, code_of(error_code::integration_not_registered));

  auto pre_registered = fixture.call(
      kAdmin, proxy,
      abi::encode_call(signatures::kRegisterUpgradedImplementation));
  ASSERT_EQ(pre_registered.code, 0u)
      << pre_registered.log << " " << pre_registered.info;
  EXPECT_EQ(record_of(fixture, next).host, proxy);
  EXPECT_EQ(record_of(fixture, next).registration,
            registration_status_t::pending);

  ASSERT_EQ(fixture
                .call(kAdmin, proxy,
                      abi::encode_call(signatures::kSetFunctionProtectionStatus,
                                       std::vector<selector_t>{kMintSelector},
                                       std::vector<bool>{true}))
                .code,
            0u);
  EXPECT_TRUE(ledger_flag(fixture, next, kMintSelector));
  EXPECT_EQ(mint().code, code_of(error_code::integration_not_active));

  // Protocol-side repair through the router override path.
  ASSERT_EQ(fixture
                .call_router(kProtocolAdmin,
                             abi::encode_call(
                                 signatures::kSetIntegrationRegistrationStatus,
                                 next, registration_status_t::registered))
                .code,
            0u);
  ASSERT_EQ(fixture
                .call_router(kProtocolAdmin,
                             abi::encode_call(
                                 signatures::kSetIntegrationAuthorizationStatus,
                                 next, authorization_status_t::active))
                .code,
            0u);
  auto repaired = mint();
  ASSERT_EQ(repaired.code, 0u) << repaired.log << " " << repaired.info;
  EXPECT_EQ(abi::decode_result<uint64_t>(repaired.data), 2u);

  // The previous logic identity keeps its own entry.
  EXPECT_EQ(record_of(fixture, logic).registration,
            registration_status_t::registered);
}

TEST(proxy_integration, upgrade_entry_points_are_admin_only) {
  auto fixture = execution_fixture{"warden_proxy_admin_only"};
  fixture.deploy_protocol(kProtocolAdmin);
  auto [logic, proxy] = fixture.deploy_proxied(kAdmin);

  EXPECT_EQ(fixture
                .call(kUser, proxy,
                      abi::encode_call(
                          signatures::kRegisterUpgradedImplementation))
                .code,
            code_of(error_code::caller_not_admin));
  EXPECT_EQ(fixture
                .call(kUser, proxy,
                      abi::encode_call(signatures::kSetFunctionProtectionStatus,
                                       std::vector<selector_t>{kMintSelector},
                                       std::vector<bool>{true}))
                .code,
            code_of(error_code::caller_not_admin));
  EXPECT_FALSE(fixture.read<bool>(
      proxy,
      abi::encode_call(signatures::kIsFunctionProtectionEnabled, kMintSelector)));
  EXPECT_EQ(fixture
                .call(kAdmin, logic,
                      abi::encode_call(signatures::kPreAuthorizeNewImplementation,
                                       make_account(0x55)))
                .code,
            code_of(error_code::delegation_not_permitted));
}
