#include <gtest/gtest.h>
#include <warden/blake3/hash.hpp>
#include <warden/execution/abi.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/testing/common.hpp>

#include <algorithm>
#include <string>
#include <tuple>
#include <vector>

using namespace warden::schema;
namespace abi = warden::execution::abi;

TEST(abi, selector_is_blake3_prefix_of_signature) {
  auto digest = warden::blake3::hash(std::string_view{"updateFlags(address,bytes4[],bool[])"});
  auto selector = abi::make_selector("updateFlags(address,bytes4[],bool[])");
  EXPECT_EQ(selector[0], digest[0]);
  EXPECT_EQ(selector[3], digest[3]);
  EXPECT_NE(selector, abi::make_selector("queryFlag(address,bytes4)"));
}

TEST(abi, encode_call_prefixes_selector) {
  auto selector = selector_t{0xAA, 0xAA, 0xAA, 0xAA};
  auto data = abi::encode_call(selector, uint64_t{5});
  ASSERT_EQ(data.size(), 12u);
  EXPECT_EQ(abi::selector_of(data), selector);
  auto args = abi::decode_arguments<uint64_t>(abi::arguments_of(data));
  EXPECT_EQ(std::get<0>(args), 5u);
}

TEST(abi, selector_of_short_data_is_empty) {
  auto data = bytes_t{0x01, 0x02, 0x03};
  EXPECT_FALSE(abi::selector_of(data).has_value());
  EXPECT_TRUE(abi::arguments_of(data).empty());
}

TEST(abi, trailing_bytes_argument_is_tail_of_call_data) {
  auto payload = warden::testing::make_filled(64, 0x5A);
  auto data = abi::encode_call(selector_t{1, 2, 3, 4}, uint64_t{1}, payload);
  ASSERT_GE(data.size(), payload.size());
  EXPECT_TRUE(std::equal(std::end(data) - 64, std::end(data),
                         std::begin(payload)));
}

TEST(abi, malformed_arguments_raise_invalid_calldata) {
  auto args = bytes_t{0x01};
  try {
    abi::decode_arguments<address_t>(args);
    FAIL() << "expected protocol_error";
  } catch (const warden::execution::protocol_error& e) {
    EXPECT_EQ(e.code(), error_code::invalid_calldata);
  }
}

TEST(abi, slots_differ_by_name_and_parts) {
  auto a = abi::make_slot("admin", std::string_view{"security_admin"});
  auto b = abi::make_slot("pending_admin", std::string_view{"security_admin"});
  auto c = abi::make_slot("admin", std::string_view{"protocol_admin"});
  EXPECT_NE(a, b);
  EXPECT_NE(a, c);
}

TEST(abi, try_decode_result_rejects_empty_bool) {
  EXPECT_FALSE(abi::try_decode_result<bool>(bytes_t{}).has_value());
  EXPECT_EQ(abi::try_decode_result<bool>(abi::encode_result(true)), true);
}

TEST(abi, protocol_error_message_names_reason) {
  auto error = warden::execution::protocol_error{error_code::payload_too_short,
                                                 "payload length 63"};
  EXPECT_EQ(std::string{error.what()}, "PayloadTooShort: payload length 63");
  EXPECT_EQ(error.detail(), "payload length 63");
}
