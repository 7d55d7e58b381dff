#include <gtest/gtest.h>
#include <warden/execution/abi.hpp>
#include <warden/node/server.hpp>
#include <warden/protocol/events.hpp>
#include <warden/protocol/signatures.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/testing/execution_fixture.hpp>
#include <warden/testing/mocks.hpp>

#include <cstdint>
#include <string>
#include <tuple>

using namespace warden::schema;
namespace abi = warden::execution::abi;
using warden::testing::execution_fixture;
using warden::testing::make_account;

namespace {

bytes_t encode_deploy(execution_fixture& fixture,
                      const address_t& sender,
                      const uint64_t nonce) {
  return fixture.encoder().encode(transaction_t{
      .chain_id = fixture.chain_id(),
      .nonce = nonce,
      .sender = sender,
      .payload = deploy_t{.code = std::string{warden::testing::kCounterCode}}});
}

}  // namespace

TEST(node_server, info_reports_committed_state) {
  auto fixture = execution_fixture{"warden_node_info"};
  fixture.deploy(make_account(1), warden::testing::kCounterCode);

  auto request = warden::node::v1::InfoRequest{};
  auto response = warden::node::v1::InfoResponse{};
  auto context = grpc::CallbackServerContext{};
  auto listener = warden::node::listener{fixture.engine()};
  auto* reactor = listener.Info(&context, &request, &response);
  ASSERT_NE(reactor, nullptr);

  auto info = fixture.engine().info();
  EXPECT_EQ(response.last_height(), 1);
  EXPECT_EQ(response.version(), info.version);
  EXPECT_EQ(response.last_state_root(),
            make_string(bytes_view_t{info.last_state_root.data(),
                                     info.last_state_root.size()}));
  EXPECT_EQ(response.chain_id(),
            make_string(bytes_view_t{fixture.chain_id().data(),
                                     fixture.chain_id().size()}));
}

TEST(node_server, check_tx_validates_without_executing) {
  auto fixture = execution_fixture{"warden_node_check"};
  auto sender = make_account(1);
  auto listener = warden::node::listener{fixture.engine()};

  auto request = warden::node::v1::TxRequest{};
  request.set_tx(make_string(encode_deploy(fixture, sender, 0)));
  auto response = warden::node::v1::TxResponse{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.CheckTx(&context, &request, &response), nullptr);
  EXPECT_EQ(response.code(), 0u);
  EXPECT_EQ(fixture.engine().nonce(sender), 0u);

  auto stale = warden::node::v1::TxRequest{};
  stale.set_tx(make_string(encode_deploy(fixture, sender, 3)));
  auto rejected = warden::node::v1::TxResponse{};
  auto stale_context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.CheckTx(&stale_context, &stale, &rejected), nullptr);
  EXPECT_EQ(rejected.code(), static_cast<uint32_t>(error_code::invalid_nonce));
  EXPECT_EQ(rejected.log(), "InvalidNonce");
}

TEST(node_server, submit_maps_result_and_events) {
  auto fixture = execution_fixture{"warden_node_submit"};
  auto protocol = fixture.deploy_protocol(make_account(0x01));
  auto sender = make_account(0xA1);
  auto listener = warden::node::listener{fixture.engine()};

  auto tx = fixture.encoder().encode(transaction_t{
      .chain_id = fixture.chain_id(),
      .nonce = fixture.engine().nonce(sender),
      .sender = sender,
      .payload = deploy_t{
          .code = std::string{warden::testing::kStandaloneDemoCode},
          .constructor_args = abi::encode_result(
              std::tuple{protocol.router, protocol.gate_keeper})}});
  auto request = warden::node::v1::TxRequest{};
  request.set_tx(make_string(tx));
  auto response = warden::node::v1::TxResponse{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Submit(&context, &request, &response), nullptr);

  ASSERT_EQ(response.code(), 0u) << response.log() << " " << response.info();
  EXPECT_EQ(response.codespace(), warden::execution::kExecuteCodespace);
  auto address = abi::decode_result<address_t>(make_bytes(response.data()));
  EXPECT_EQ(fixture.engine().account(address)->code,
            warden::testing::kStandaloneDemoCode);

  ASSERT_EQ(response.events_size(), 2);
  EXPECT_EQ(response.events(0).type(),
            warden::protocol::events::kAdminTransferred);
  EXPECT_EQ(response.events(1).type(),
            warden::protocol::events::kRegistrationStatusChanged);
  auto found_identity = false;
  for (const auto& attribute : response.events(1).attributes()) {
    if (attribute.key() == "identity") {
      found_identity = true;
      EXPECT_EQ(attribute.value(), to_hex(address));
      EXPECT_TRUE(attribute.index());
    }
  }
  EXPECT_TRUE(found_identity);
}

TEST(node_server, query_routes_to_engine) {
  auto fixture = execution_fixture{"warden_node_query"};
  auto sender = make_account(1);
  auto counter = fixture.deploy(sender, warden::testing::kCounterCode);
  auto listener = warden::node::listener{fixture.engine()};

  auto call = fixture.encoder().encode(
      std::tuple{sender, counter, abi::encode_call(warden::testing::kCount)});
  auto request = warden::node::v1::QueryRequest{};
  request.set_path("/call");
  request.set_data(make_string(call));
  auto response = warden::node::v1::QueryResponse{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Query(&context, &request, &response), nullptr);
  EXPECT_EQ(response.code(), 0u);
  EXPECT_EQ(response.height(), 1);
  EXPECT_EQ(abi::decode_result<uint64_t>(make_bytes(response.value())), 0u);

  auto unknown = warden::node::v1::QueryRequest{};
  unknown.set_path("/nope");
  auto failed = warden::node::v1::QueryResponse{};
  auto unknown_context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Query(&unknown_context, &unknown, &failed), nullptr);
  EXPECT_EQ(failed.code(), static_cast<uint32_t>(error_code::invalid_query));
  EXPECT_EQ(failed.codespace(), warden::execution::kQueryCodespace);
}
