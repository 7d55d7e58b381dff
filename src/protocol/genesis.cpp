#include <spdlog/spdlog.h>
#include <warden/execution/abi.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/protocol/gate_keeper.hpp>
#include <warden/protocol/genesis.hpp>
#include <warden/protocol/router.hpp>
#include <warden/protocol/signatures.hpp>

#include <string>
#include <utility>

using namespace warden::schema;

namespace warden::protocol {

namespace {

namespace abi = warden::execution::abi;

bytes_t submit(execution::engine& engine,
               const address_t& deployer,
               transaction_payload_t payload) {
  auto tx = transaction_t{.chain_id = engine.chain_id(),
                          .nonce = engine.nonce(deployer),
                          .sender = deployer,
                          .payload = std::move(payload)};
  auto result = engine.execute(tx);
  if (result.code != static_cast<uint32_t>(error_code::ok)) {
    spdlog::error("Genesis request failed: {} {}", result.log, result.info);
    throw execution::protocol_error{static_cast<error_code>(result.code),
                                    result.info};
  }
  return std::move(result.data);
}

address_t submit_deployment(execution::engine& engine,
                            const address_t& deployer,
                            transaction_payload_t payload) {
  return abi::decode_result<address_t>(
      submit(engine, deployer, std::move(payload)));
}

}  // namespace

void register_protocol_code(execution::code_registry& registry) {
  registry.add<router>(std::string{kRouterCode});
  registry.add<gate_keeper>(std::string{kGateKeeperCode});
}

protocol_addresses deploy_protocol(execution::engine& engine,
                                   const address_t& deployer,
                                   const address_t& protocol_admin,
                                   const registrar_key_t& registrar_key) {
  auto addresses = protocol_addresses{};
  addresses.router_logic = submit_deployment(
      engine, deployer, deploy_t{.code = std::string{kRouterCode}});
  addresses.router = submit_deployment(
      engine, deployer,
      deploy_proxy_t{.implementation = addresses.router_logic,
                     .proxy_admin = protocol_admin});
  addresses.gate_keeper = submit_deployment(
      engine, deployer,
      deploy_t{.code = std::string{kGateKeeperCode},
               .constructor_args = abi::encode_result(addresses.router)});
  submit(engine, deployer,
         call_t{.to = addresses.router,
                .data = abi::encode_call(signatures::kRouterInitialize,
                                         protocol_admin, registrar_key,
                                         addresses.gate_keeper)});

  spdlog::info("Protocol deployed: router {} (logic {}), gate keeper {}",
               to_hex(addresses.router), to_hex(addresses.router_logic),
               to_hex(addresses.gate_keeper));
  return addresses;
}

std::optional<protocol_addresses> find_protocol(
    const execution::engine& engine,
    const address_t& deployer) {
  auto addresses =
      protocol_addresses{.router_logic = execution::make_contract_address(deployer, 0),
                         .router = execution::make_contract_address(deployer, 1),
                         .gate_keeper =
                             execution::make_contract_address(deployer, 2)};
  auto gate_keeper = engine.account(addresses.gate_keeper);
  if (!gate_keeper || gate_keeper->code != kGateKeeperCode) {
    return std::nullopt;
  }
  return addresses;
}

}  // namespace warden::protocol
