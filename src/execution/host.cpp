#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/schema/key/engine_keys.hpp>

#include <algorithm>
#include <string>
#include <tuple>
#include <utility>

using namespace warden::schema;

namespace warden::execution {

namespace {

transaction_event_t make_proxy_upgraded_event(const address_t& proxy,
                                              const address_t& previous,
                                              const address_t& implementation) {
  return transaction_event_t{
      .type = "proxy_upgraded",
      .attributes = {
          transaction_event_attribute_t{
              .key = "proxy", .value = to_hex(proxy), .index = true},
          transaction_event_attribute_t{
              .key = "previous", .value = to_hex(previous), .index = false},
          transaction_event_attribute_t{.key = "implementation",
                                        .value = to_hex(implementation),
                                        .index = true}}};
}

}  // namespace

address_t make_contract_address(const address_t& deployer,
                                const uint64_t nonce) {
  auto encoder = warden::schema::encoding::encoder<
      warden::schema::encoding::scale_encoder_tag>{};
  auto material = encoder.encode(
      std::tuple{std::string_view{"warden-address-v1"}, deployer, nonce});
  auto digest =
      warden::blake3::hash(bytes_view_t{material.data(), material.size()});
  auto address = address_t{};
  std::copy_n(std::begin(digest), address.size(), std::begin(address));
  return address;
}

host::host(warden::storage::unit_of_work& work,
           const code_registry& registry,
           const instance_map_t& instances,
           const hash32_t& chain_id,
           const signature_verifier_t& verifier,
           const uint64_t height)
    : work_{work},
      registry_{registry},
      instances_{instances},
      chain_id_{chain_id},
      verifier_{verifier},
      height_{height} {}

call_frame host::make_root_frame(const address_t& sender) {
  return call_frame{
      .sender = sender, .sender_code = sender, .self = sender, .code = sender};
}

bytes_t host::call(const call_frame& caller,
                   const address_t& to,
                   const amount_t& value,
                   const bytes_t& data) {
  require(caller.depth < kMaxCallDepth, error_code::call_depth_exceeded);
  auto frame = call_frame{.sender = caller.self,
                          .sender_code = caller.code,
                          .self = to,
                          .code = resolve_code(to),
                          .value = value,
                          .data = data,
                          .read_only = caller.read_only,
                          .depth = caller.depth + 1};
  return run(frame);
}

bytes_t host::static_call(const call_frame& caller,
                          const address_t& to,
                          const bytes_t& data) {
  require(caller.depth < kMaxCallDepth, error_code::call_depth_exceeded);
  auto frame = call_frame{.sender = caller.self,
                          .sender_code = caller.code,
                          .self = to,
                          .code = resolve_code(to),
                          .data = data,
                          .read_only = true,
                          .depth = caller.depth + 1};
  return run(frame);
}

bytes_t host::delegate_call(const call_frame& caller,
                            const address_t& code,
                            const bytes_t& data) {
  require(caller.depth < kMaxCallDepth, error_code::call_depth_exceeded);
  auto frame = call_frame{.sender = caller.sender,
                          .sender_code = caller.sender_code,
                          .self = caller.self,
                          .code = resolve_code(code),
                          .value = caller.value,
                          .data = data,
                          .read_only = caller.read_only,
                          .depth = caller.depth + 1};
  return run(frame);
}

address_t host::deploy(const call_frame& caller,
                       const std::string_view code,
                       const bytes_t& constructor_args) {
  require_writable(caller);
  require(caller.depth < kMaxCallDepth, error_code::call_depth_exceeded);
  const auto* factory = registry_.find(code);
  require(factory != nullptr, error_code::code_missing, code);

  auto point = work_.mark();
  auto address = next_address(caller.self);
  try {
    require(!account(address).has_value(), error_code::account_exists,
            to_hex(address));
    auto instance =
        (*factory)(address, bytes_view_t{constructor_args.data(),
                                         constructor_args.size()});
    write_account(address,
                  account_record_t{.kind = account_kind_t::contract,
                                   .code = std::string{code},
                                   .constructor_args = constructor_args,
                                   .deployer = caller.self});
    deployed_.insert_or_assign(address, instance);

    auto frame = call_frame{.sender = caller.self,
                            .sender_code = caller.code,
                            .self = address,
                            .code = address,
                            .data = constructor_args,
                            .depth = caller.depth + 1};
    instance->construct(*this, frame);
  } catch (...) {
    work_.restore(std::move(point));
    deployed_.erase(address);
    throw;
  }
  spdlog::debug("Deployed '{}' at {}", code, to_hex(address));
  return address;
}

address_t host::deploy_proxy(const call_frame& caller,
                             const address_t& implementation,
                             const address_t& proxy_admin,
                             const bytes_t& initialize_data) {
  require_writable(caller);
  require(!is_zero(proxy_admin), error_code::zero_address, "proxy admin");
  auto target = account(implementation);
  require(target.has_value(), error_code::account_missing,
          to_hex(implementation));
  require(target->kind == account_kind_t::contract, error_code::code_missing,
          "proxy implementation must be a contract account");

  auto point = work_.mark();
  auto address = next_address(caller.self);
  try {
    require(!account(address).has_value(), error_code::account_exists,
            to_hex(address));
    write_account(address, account_record_t{.kind = account_kind_t::proxy,
                                            .deployer = caller.self,
                                            .implementation = implementation,
                                            .proxy_admin = proxy_admin});
    if (!initialize_data.empty()) {
      call(caller, address, amount_t{}, initialize_data);
    }
  } catch (...) {
    work_.restore(std::move(point));
    throw;
  }
  spdlog::debug("Deployed proxy {} -> {}", to_hex(address),
                to_hex(implementation));
  return address;
}

bytes_t host::upgrade_proxy(const call_frame& caller,
                            const address_t& proxy,
                            const address_t& implementation,
                            const bytes_t& data) {
  require_writable(caller);
  auto record = account(proxy);
  require(record.has_value(), error_code::account_missing, to_hex(proxy));
  require(record->kind == account_kind_t::proxy, error_code::not_a_proxy,
          to_hex(proxy));
  require(record->proxy_admin == caller.self,
          error_code::caller_not_proxy_admin, to_hex(caller.self));
  auto target = account(implementation);
  require(target.has_value(), error_code::account_missing,
          to_hex(implementation));
  require(target->kind == account_kind_t::contract, error_code::code_missing,
          "proxy implementation must be a contract account");

  auto point = work_.mark();
  try {
    auto previous = record->implementation.value_or(make_zero_address());
    record->implementation = implementation;
    write_account(proxy, *record);
    work_.emit(proxy,
               make_proxy_upgraded_event(proxy, previous, implementation));
    if (data.empty()) {
      return {};
    }
    return call(caller, proxy, amount_t{}, data);
  } catch (...) {
    work_.restore(std::move(point));
    throw;
  }
}

std::optional<bytes_t> host::load(const call_frame& frame,
                                  const bytes_t& slot) const {
  auto encoder = encoder_t{};
  auto key = warden::schema::key::make_slot_key(encoder, frame.self, slot);
  return work_.read(bytes_view_t{key.data(), key.size()});
}

void host::store(const call_frame& frame,
                 const bytes_t& slot,
                 const bytes_t& value) {
  require_writable(frame);
  auto encoder = encoder_t{};
  work_.write(warden::schema::key::make_slot_key(encoder, frame.self, slot),
              value);
}

void host::erase(const call_frame& frame, const bytes_t& slot) {
  require_writable(frame);
  auto encoder = encoder_t{};
  work_.erase(warden::schema::key::make_slot_key(encoder, frame.self, slot));
}

void host::emit(const call_frame& frame, transaction_event_t event) {
  require_writable(frame);
  work_.emit(frame.self, std::move(event));
}

std::optional<account_record_t> host::account(const address_t& address) const {
  auto encoder = encoder_t{};
  return work_.get<account_record_t>(
      warden::schema::key::make_account_key(encoder, address));
}

std::optional<address_t> host::implementation_of(
    const address_t& address) const {
  auto record = account(address);
  if (!record || record->kind != account_kind_t::proxy) {
    return std::nullopt;
  }
  return record->implementation;
}

const hash32_t& host::chain_id() const noexcept {
  return chain_id_;
}

uint64_t host::height() const noexcept {
  return height_;
}

bool host::verify_registrar_signature(
    const bytes_view_t& message,
    const registrar_key_t& registrar_key,
    const registrar_signature_t& signature) const {
  if (!verifier_) {
    return false;
  }
  return verifier_(message, registrar_key, signature);
}

instance_map_t host::take_deployed() {
  return std::exchange(deployed_, instance_map_t{});
}

std::shared_ptr<contract> host::instance_for(const address_t& code) const {
  if (auto it = deployed_.find(code); it != std::end(deployed_)) {
    return it->second;
  }
  if (auto it = instances_.find(code); it != std::end(instances_)) {
    return it->second;
  }
  throw protocol_error{error_code::code_missing, to_hex(code)};
}

address_t host::resolve_code(const address_t& address) const {
  auto record = account(address);
  require(record.has_value(), error_code::account_missing, to_hex(address));
  if (record->kind == account_kind_t::proxy) {
    require(record->implementation.has_value(), error_code::code_missing,
            to_hex(address));
    return *record->implementation;
  }
  return address;
}

address_t host::next_address(const address_t& deployer) {
  auto encoder = encoder_t{};
  auto nonce_key =
      warden::schema::key::make_deploy_nonce_key(encoder, deployer);
  auto nonce = work_.get<uint64_t>(nonce_key).value_or(0);
  work_.put(nonce_key, nonce + 1);
  return make_contract_address(deployer, nonce);
}

void host::write_account(const address_t& address,
                         const account_record_t& record) {
  auto encoder = encoder_t{};
  work_.put(warden::schema::key::make_account_key(encoder, address), record);
}

bytes_t host::run(const call_frame& frame) {
  auto instance = instance_for(frame.code);
  auto point = work_.mark();
  try {
    return instance->invoke(*this, frame);
  } catch (...) {
    work_.restore(std::move(point));
    throw;
  }
}

void host::require_writable(const call_frame& frame) const {
  require(!frame.read_only, error_code::static_call_violation);
}

}  // namespace warden::execution
