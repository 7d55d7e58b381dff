#include <gtest/gtest.h>
#include <warden/execution/abi.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/schema/account_record.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <warden/storage/unit_of_work.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/execution_fixture.hpp>
#include <warden/testing/mocks.hpp>

#include <functional>
#include <memory>
#include <string>

using namespace warden::schema;
using warden::execution::host;
using warden::execution::protocol_error;
namespace abi = warden::execution::abi;
namespace testing_ns = warden::testing;

namespace {

class host_test : public ::testing::Test {
 protected:
  host_test()
      : db_path_{testing_ns::make_db_path("warden_host")},
        storage_{warden::storage::make_storage<
            warden::storage::rocksdb_storage_tag>(db_path_)},
        registry_{testing_ns::execution_fixture::make_registry(
            std::make_shared<testing_ns::module_trace>())},
        verifier_{testing_ns::execution_fixture::allow_all_verifier()},
        work_{storage_},
        runtime_{work_, registry_, instances_, testing_ns::make_hash(7),
                 verifier_, 1},
        root_{host::make_root_frame(testing_ns::make_account(1))} {}

  ~host_test() override { testing_ns::remove_path(db_path_); }

  uint64_t count(const address_t& target) {
    return abi::decode_result<uint64_t>(
        runtime_.static_call(root_, target, abi::encode_call(testing_ns::kCount)));
  }

  static error_code failure_of(const std::function<void()>& action) {
    try {
      action();
    } catch (const protocol_error& e) {
      return e.code();
    }
    return error_code::ok;
  }

  std::string db_path_;
  warden::storage::storage<warden::storage::rocksdb_storage_tag> storage_;
  warden::execution::code_registry registry_;
  warden::execution::instance_map_t instances_;
  warden::execution::signature_verifier_t verifier_;
  warden::storage::unit_of_work work_;
  host runtime_;
  warden::execution::call_frame root_;
};

}  // namespace

TEST_F(host_test, deploy_uses_deterministic_addresses) {
  auto first = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  auto second = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  EXPECT_EQ(first, warden::execution::make_contract_address(root_.self, 0));
  EXPECT_EQ(second, warden::execution::make_contract_address(root_.self, 1));

  auto record = runtime_.account(first);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->kind, account_kind_t::contract);
  EXPECT_EQ(record->code, testing_ns::kCounterCode);
  EXPECT_EQ(record->deployer, root_.self);
}

TEST_F(host_test, deploy_of_unknown_code_fails) {
  EXPECT_EQ(failure_of([&] { runtime_.deploy(root_, "missing.code", {}); }),
            error_code::code_missing);
}

TEST_F(host_test, call_writes_callee_storage) {
  auto target = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  runtime_.call(root_, target, amount_t{},
                abi::encode_call(testing_ns::kIncrement, uint64_t{4}));
  runtime_.call(root_, target, amount_t{},
                abi::encode_call(testing_ns::kIncrement, uint64_t{2}));
  EXPECT_EQ(count(target), 6u);
}

TEST_F(host_test, failed_nested_call_restores_its_writes) {
  auto target = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  runtime_.call(root_, target, amount_t{},
                abi::encode_call(testing_ns::kIncrement, uint64_t{1}));
  auto events_before = work_.events().size();

  EXPECT_EQ(failure_of([&] {
              runtime_.call(root_, target, amount_t{},
                            abi::encode_call(testing_ns::kIncrementThenFail,
                                             uint64_t{10}));
            }),
            error_code::invalid_calldata);
  EXPECT_EQ(count(target), 1u);
  EXPECT_EQ(work_.events().size(), events_before);
}

TEST_F(host_test, static_call_rejects_writes) {
  auto target = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  EXPECT_EQ(failure_of([&] {
              runtime_.static_call(
                  root_, target,
                  abi::encode_call(testing_ns::kIncrement, uint64_t{1}));
            }),
            error_code::static_call_violation);
  EXPECT_EQ(count(target), 0u);
}

TEST_F(host_test, delegate_call_runs_code_against_caller_storage) {
  auto target = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  auto forwarder = runtime_.deploy(root_, testing_ns::kDelegatorCode, {});

  runtime_.call(root_, forwarder, amount_t{},
                abi::encode_call(testing_ns::kForward, target,
                                 abi::encode_call(testing_ns::kIncrement,
                                                  uint64_t{3})));
  EXPECT_EQ(count(target), 0u);

  auto forwarded = abi::decode_result<bytes_t>(runtime_.static_call(
      root_, forwarder,
      abi::encode_call(testing_ns::kForward, target,
                       abi::encode_call(testing_ns::kCount))));
  EXPECT_EQ(abi::decode_result<uint64_t>(forwarded), 3u);
}

TEST_F(host_test, proxy_executes_implementation_against_own_storage) {
  auto implementation = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  auto proxy = runtime_.deploy_proxy(root_, implementation, root_.self, {});

  runtime_.call(root_, proxy, amount_t{},
                abi::encode_call(testing_ns::kIncrement, uint64_t{7}));
  EXPECT_EQ(count(proxy), 7u);
  EXPECT_EQ(count(implementation), 0u);
  EXPECT_EQ(runtime_.implementation_of(proxy), implementation);
  EXPECT_FALSE(runtime_.implementation_of(implementation).has_value());
}

TEST_F(host_test, upgrade_requires_proxy_admin) {
  auto first = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  auto second = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  auto proxy =
      runtime_.deploy_proxy(root_, first, testing_ns::make_account(9), {});

  EXPECT_EQ(failure_of([&] { runtime_.upgrade_proxy(root_, proxy, second, {}); }),
            error_code::caller_not_proxy_admin);
  EXPECT_EQ(failure_of([&] { runtime_.upgrade_proxy(root_, first, second, {}); }),
            error_code::not_a_proxy);

  auto admin = host::make_root_frame(testing_ns::make_account(9));
  runtime_.upgrade_proxy(admin, proxy, second, {});
  EXPECT_EQ(runtime_.implementation_of(proxy), second);
  ASSERT_FALSE(work_.events().empty());
  EXPECT_EQ(work_.events().back().event.type, "proxy_upgraded");
}

TEST_F(host_test, proxy_requires_admin_and_contract_implementation) {
  auto implementation = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  EXPECT_EQ(failure_of([&] {
              runtime_.deploy_proxy(root_, implementation, make_zero_address(),
                                    {});
            }),
            error_code::zero_address);
  EXPECT_EQ(failure_of([&] {
              runtime_.deploy_proxy(root_, testing_ns::make_account(42),
                                    root_.self, {});
            }),
            error_code::account_missing);
}

TEST_F(host_test, dispatch_failures_are_structured) {
  auto target = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  EXPECT_EQ(failure_of([&] {
              runtime_.call(root_, testing_ns::make_account(77), amount_t{},
                            abi::encode_call(testing_ns::kCount));
            }),
            error_code::account_missing);
  EXPECT_EQ(failure_of([&] {
              runtime_.call(root_, target, amount_t{},
                            abi::encode_call("unknown()"));
            }),
            error_code::function_not_found);
  EXPECT_EQ(failure_of([&] {
              runtime_.call(root_, target, amount_t{}, bytes_t{0x01});
            }),
            error_code::invalid_calldata);
}

TEST_F(host_test, call_depth_is_bounded) {
  auto target = runtime_.deploy(root_, testing_ns::kCounterCode, {});
  auto deep = root_;
  deep.depth = warden::execution::kMaxCallDepth;
  EXPECT_EQ(failure_of([&] {
              runtime_.call(deep, target, amount_t{},
                            abi::encode_call(testing_ns::kCount));
            }),
            error_code::call_depth_exceeded);
}
