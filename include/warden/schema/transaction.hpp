#pragma once
#include <warden/schema/call.hpp>
#include <warden/schema/deploy.hpp>
#include <warden/schema/deploy_proxy.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/upgrade_proxy.hpp>
#include <variant>

namespace warden::schema {

using transaction_payload_t =
    std::variant<call_t, deploy_t, deploy_proxy_t, upgrade_proxy_t>;

template <uint16_t Version>
struct transaction;

// Sender authentication belongs to the ingress layer in front of the engine;
// the engine trusts `sender` and enforces chain id and nonce ordering.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  address_t sender{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace warden::schema
