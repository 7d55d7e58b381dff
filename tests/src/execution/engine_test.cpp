#include <gtest/gtest.h>
#include <warden/execution/abi.hpp>
#include <warden/execution/engine.hpp>
#include <warden/execution/host.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/execution_fixture.hpp>
#include <warden/testing/mocks.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

using namespace warden::schema;
namespace abi = warden::execution::abi;
using warden::testing::execution_fixture;
using warden::testing::make_account;
using warden::testing::make_hash;

namespace {

uint32_t code_of(const error_code code) {
  return static_cast<uint32_t>(code);
}

bytes_t encode_range(execution_fixture& fixture,
                     const uint64_t from,
                     const uint64_t to) {
  return fixture.encoder().encode(std::tuple{from, to});
}

}  // namespace

TEST(engine, rejects_wrong_chain_nonce_and_version) {
  auto fixture = execution_fixture{"warden_engine_validation"};
  auto sender = make_account(1);
  auto& engine = fixture.engine();

  auto tx = transaction_t{.chain_id = make_hash(99),
                          .nonce = 0,
                          .sender = sender,
                          .payload = deploy_t{.code = std::string{
                                                  warden::testing::kCounterCode}}};
  EXPECT_EQ(engine.execute(tx).code, code_of(error_code::invalid_chain_id));

  tx.chain_id = fixture.chain_id();
  tx.nonce = 5;
  EXPECT_EQ(engine.execute(tx).code, code_of(error_code::invalid_nonce));

  tx.nonce = 0;
  tx.version = 2;
  EXPECT_EQ(engine.execute(tx).code,
            code_of(error_code::unsupported_transaction_version));

  // Rejected requests never reach history.
  EXPECT_EQ(engine.nonce(sender), 0u);
  EXPECT_EQ(engine.info().last_height, 0);
}

TEST(engine, check_transaction_does_not_execute) {
  auto fixture = execution_fixture{"warden_engine_check"};
  auto sender = make_account(1);
  auto tx = transaction_t{.chain_id = fixture.chain_id(),
                          .nonce = 0,
                          .sender = sender,
                          .payload = deploy_t{.code = std::string{
                                                  warden::testing::kCounterCode}}};
  auto raw = fixture.encoder().encode(tx);

  auto checked = fixture.engine().check_transaction(
      bytes_view_t{raw.data(), raw.size()});
  EXPECT_EQ(checked.code, 0u);
  EXPECT_EQ(checked.codespace, warden::execution::kCheckCodespace);
  EXPECT_EQ(fixture.engine().nonce(sender), 0u);

  auto garbage = bytes_t{0x01, 0x02};
  EXPECT_EQ(fixture.engine()
                .check_transaction(bytes_view_t{garbage.data(), garbage.size()})
                .code,
            code_of(error_code::invalid_transaction));
  EXPECT_EQ(fixture.engine().execute(bytes_view_t{}).code,
            code_of(error_code::invalid_transaction));
}

TEST(engine, executes_encoded_request) {
  auto fixture = execution_fixture{"warden_engine_raw"};
  auto sender = make_account(1);
  auto tx = transaction_t{.chain_id = fixture.chain_id(),
                          .nonce = 0,
                          .sender = sender,
                          .payload = deploy_t{.code = std::string{
                                                  warden::testing::kCounterCode}}};
  auto raw = fixture.encoder().encode(tx);

  auto result = fixture.engine().execute(bytes_view_t{raw.data(), raw.size()});
  ASSERT_EQ(result.code, 0u) << result.log << " " << result.info;
  EXPECT_EQ(abi::decode_result<address_t>(result.data),
            warden::execution::make_contract_address(sender, 0));
  EXPECT_EQ(fixture.engine().nonce(sender), 1u);
}

TEST(engine, failed_request_advances_nonce_and_history_only) {
  auto fixture = execution_fixture{"warden_engine_failure"};
  auto sender = make_account(1);
  auto counter = fixture.deploy(sender, warden::testing::kCounterCode);
  ASSERT_EQ(fixture
                .call(sender, counter,
                      abi::encode_call(warden::testing::kIncrement, uint64_t{2}))
                .code,
            0u);
  auto before = fixture.engine().info();

  auto failed = fixture.call(
      sender, counter,
      abi::encode_call(warden::testing::kIncrementThenFail, uint64_t{40}));
  EXPECT_EQ(failed.code, code_of(error_code::invalid_calldata));
  EXPECT_EQ(failed.log, "InvalidCalldata");
  EXPECT_EQ(failed.info, "after increment");
  EXPECT_EQ(failed.codespace, warden::execution::kExecuteCodespace);

  auto after = fixture.engine().info();
  EXPECT_EQ(after.last_height, before.last_height + 1);
  EXPECT_NE(after.last_state_root, before.last_state_root);
  EXPECT_EQ(fixture.engine().nonce(sender), 3u);
  EXPECT_EQ(fixture.read<uint64_t>(counter,
                                   abi::encode_call(warden::testing::kCount)),
            2u);

  auto history = fixture.engine().history(1, 10);
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history.back().height, 3u);
  EXPECT_EQ(history.back().code, code_of(error_code::invalid_calldata));
}

TEST(engine, failed_request_discards_events) {
  auto fixture = execution_fixture{"warden_engine_events"};
  auto admin = make_account(1);
  auto first = fixture.deploy(admin, warden::testing::kCounterCode);
  auto second = fixture.deploy(admin, warden::testing::kCounterCode);
  auto proxy = fixture.deploy_proxy(admin, first, admin);

  auto failed = fixture.submit(
      admin, upgrade_proxy_t{.proxy = proxy,
                             .implementation = second,
                             .data = abi::encode_call(
                                 warden::testing::kIncrementThenFail,
                                 uint64_t{1})});
  EXPECT_NE(failed.code, 0u);
  EXPECT_TRUE(failed.events.empty());
  EXPECT_TRUE(fixture.engine().events(0, 100).empty());
  EXPECT_EQ(fixture.engine().account(proxy)->implementation, first);

  auto upgraded = fixture.submit(
      admin, upgrade_proxy_t{.proxy = proxy, .implementation = second});
  ASSERT_EQ(upgraded.code, 0u) << upgraded.log << " " << upgraded.info;
  ASSERT_EQ(upgraded.events.size(), 1u);
  EXPECT_EQ(upgraded.events.front().type, "proxy_upgraded");

  auto records = fixture.engine().events(0, 100);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records.front().event_id, 0u);
  EXPECT_EQ(records.front().emitter, proxy);
  EXPECT_EQ(records.front().height,
            static_cast<uint64_t>(fixture.engine().info().last_height));
}

TEST(engine, query_routes) {
  auto fixture = execution_fixture{"warden_engine_query"};
  auto sender = make_account(1);
  auto counter = fixture.deploy(sender, warden::testing::kCounterCode);
  auto& engine = fixture.engine();

  auto info = engine.query("/engine/info", {});
  ASSERT_EQ(info.code, 0u);
  auto [height, state_root, chain_id] =
      fixture.encoder().decode<std::tuple<int64_t, hash32_t, hash32_t>>(
          bytes_view_t{info.value.data(), info.value.size()});
  EXPECT_EQ(height, 1);
  EXPECT_EQ(state_root, engine.info().last_state_root);
  EXPECT_EQ(chain_id, fixture.chain_id());

  auto key = fixture.encoder().encode(counter);
  auto account = engine.query("/account", bytes_view_t{key.data(), key.size()});
  ASSERT_EQ(account.code, 0u);
  auto record = fixture.encoder().decode<account_record_t>(
      bytes_view_t{account.value.data(), account.value.size()});
  EXPECT_EQ(record.code, warden::testing::kCounterCode);

  auto unknown = fixture.encoder().encode(make_account(55));
  EXPECT_EQ(engine.query("/account", bytes_view_t{unknown.data(), unknown.size()})
                .code,
            code_of(error_code::account_missing));

  auto sender_key = fixture.encoder().encode(sender);
  auto nonce =
      engine.query("/nonce", bytes_view_t{sender_key.data(), sender_key.size()});
  ASSERT_EQ(nonce.code, 0u);
  EXPECT_EQ(fixture.encoder().decode<uint64_t>(
                bytes_view_t{nonce.value.data(), nonce.value.size()}),
            1u);

  auto range = encode_range(fixture, 0, 10);
  auto history =
      engine.query("/history/range", bytes_view_t{range.data(), range.size()});
  ASSERT_EQ(history.code, 0u);
  EXPECT_EQ(fixture.encoder()
                .decode<std::vector<history_entry_t>>(
                    bytes_view_t{history.value.data(), history.value.size()})
                .size(),
            1u);

  auto inverted = encode_range(fixture, 5, 1);
  EXPECT_EQ(engine
                .query("/events/range",
                       bytes_view_t{inverted.data(), inverted.size()})
                .code,
            code_of(error_code::invalid_query));
  EXPECT_EQ(engine.query("/unknown", {}).code, code_of(error_code::invalid_query));
  EXPECT_EQ(engine.query("/account", {}).code, code_of(error_code::invalid_query));
}

TEST(engine, range_end_saturates_near_the_top_of_the_id_space) {
  using warden::execution::clamp_range_end;
  using warden::execution::kMaxQueryRange;
  constexpr auto kTop = std::numeric_limits<uint64_t>::max();

  EXPECT_EQ(clamp_range_end(0, 10), 10u);
  EXPECT_EQ(clamp_range_end(0, kTop), kMaxQueryRange - 1);
  EXPECT_EQ(clamp_range_end(kTop - 5, kTop), kTop);
  EXPECT_EQ(clamp_range_end(kTop, kTop), kTop);
  EXPECT_EQ(clamp_range_end(kTop - kMaxQueryRange, kTop), kTop - 1);

  auto fixture = execution_fixture{"warden_engine_query_top"};
  fixture.deploy(make_account(1), warden::testing::kCounterCode);
  auto range = encode_range(fixture, kTop - 5, kTop);
  auto history = fixture.engine().query(
      "/history/range", bytes_view_t{range.data(), range.size()});
  ASSERT_EQ(history.code, 0u);
  EXPECT_TRUE(fixture.encoder()
                  .decode<std::vector<history_entry_t>>(
                      bytes_view_t{history.value.data(), history.value.size()})
                  .empty());
}

TEST(engine, read_only_call_cannot_write) {
  auto fixture = execution_fixture{"warden_engine_view"};
  auto sender = make_account(1);
  auto counter = fixture.deploy(sender, warden::testing::kCounterCode);

  auto view = fixture.view(
      counter, abi::encode_call(warden::testing::kIncrement, uint64_t{1}));
  EXPECT_EQ(view.code, code_of(error_code::static_call_violation));
  EXPECT_EQ(view.log, "StaticCallViolation");
  EXPECT_EQ(fixture.read<uint64_t>(counter,
                                   abi::encode_call(warden::testing::kCount)),
            0u);
}

TEST(engine, restart_restores_committed_state_and_contracts) {
  auto fixture = execution_fixture{"warden_engine_restart"};
  auto sender = make_account(1);
  auto counter = fixture.deploy(sender, warden::testing::kCounterCode);
  ASSERT_EQ(fixture
                .call(sender, counter,
                      abi::encode_call(warden::testing::kIncrement, uint64_t{9}))
                .code,
            0u);
  auto before = fixture.engine().info();

  auto restarted = warden::execution::engine{
      fixture.encoder(), fixture.storage(), fixture.chain_id(),
      execution_fixture::make_registry(
          std::make_shared<warden::testing::module_trace>())};
  auto after = restarted.info();
  EXPECT_EQ(after.last_height, before.last_height);
  EXPECT_EQ(after.last_state_root, before.last_state_root);
  EXPECT_EQ(restarted.nonce(sender), 2u);

  auto request = fixture.encoder().encode(
      std::tuple{sender, counter, abi::encode_call(warden::testing::kCount)});
  auto count =
      restarted.query("/call", bytes_view_t{request.data(), request.size()});
  ASSERT_EQ(count.code, 0u) << count.log << " " << count.info;
  EXPECT_EQ(abi::decode_result<uint64_t>(count.value), 9u);
}
