#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/execution/engine.hpp>
#include <warden/execution/protocol_error.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/storage/unit_of_work.hpp>
#include <algorithm>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace warden::schema;

namespace {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

warden::schema::hash32_t fold_state_root(const warden::schema::hash32_t& seed,
                                         const warden::schema::bytes_t& tx,
                                         uint64_t height,
                                         uint32_t code) {
  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, code});
  return warden::blake3::hasher{}
      .update(bytes_view_t{seed.data(), seed.size()})
      .update(bytes_view_t{tx.data(), tx.size()})
      .update(bytes_view_t{encoded_suffix.data(), encoded_suffix.size()})
      .finalize();
}

transaction_result_t make_failure(const error_code code,
                                  std::string info,
                                  const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_failure(const error_code code,
                                  std::string info,
                                  const bytes_view_t& key) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.key = make_bytes(key);
  result.codespace = std::string{warden::execution::kQueryCodespace};
  return result;
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction failed to decode";
  }
  return tx;
}

warden::execution::signature_verifier_t default_signature_verifier() {
  return [](const bytes_view_t& message, const registrar_key_t& registrar_key,
            const registrar_signature_t& signature) {
    return warden::crypto::verify_registrar_signature(message, registrar_key,
                                                      signature);
  };
}

}  // namespace

namespace warden::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const hash32_t& chain_id,
               code_registry registry)
    : encoder_{encoder},
      storage_{storage},
      chain_id_{chain_id},
      registry_{std::move(registry)},
      signature_verifier_{default_signature_verifier()} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine for chain {}",
               to_hex(bytes_view_t{chain_id_.data(), chain_id_.size()}));
  load_persisted_state();
  if (!crypto::available()) {
    spdlog::warn("OpenSSL secp256k1 support unavailable; registrar "
                 "credentials will be rejected");
  }
  spdlog::info("Execution engine ready at height {} with {} logic unit(s)",
               last_committed_height_, instances_.size());
}

transaction_result_t engine::check_transaction(
    const bytes_view_t& raw_tx) const {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_failure(error_code::invalid_transaction, decode_error,
                        kCheckCodespace);
  }
  auto lock = std::scoped_lock{mutex_};
  return validate_transaction(*maybe_tx, kCheckCodespace);
}

transaction_result_t engine::execute(const bytes_view_t& raw_tx) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    spdlog::warn("Rejected request: {}", decode_error);
    return make_failure(error_code::invalid_transaction, decode_error,
                        kExecuteCodespace);
  }
  auto lock = std::scoped_lock{mutex_};
  return execute_validated(*maybe_tx, make_bytes(raw_tx));
}

transaction_result_t engine::execute(const transaction_t& tx) {
  auto raw_tx = encoder_.encode(tx);
  auto lock = std::scoped_lock{mutex_};
  return execute_validated(tx, raw_tx);
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_height = last_committed_height_;
  result.last_state_root = last_committed_state_root_;
  result.chain_id = chain_id_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
    return result;
  }

  if (path == "/account") {
    auto address = encoder_.try_decode<address_t>(data);
    if (!address) {
      return make_query_failure(error_code::invalid_query,
                                "expected an address", data);
    }
    auto record = storage_.get<encoder_t, account_record_t>(
        encoder_, warden::schema::key::make_account_key(encoder_, *address));
    if (!record) {
      return make_query_failure(error_code::account_missing, to_hex(*address),
                                data);
    }
    result.value = encoder_.encode(*record);
    return result;
  }

  if (path == "/nonce") {
    auto address = encoder_.try_decode<address_t>(data);
    if (!address) {
      return make_query_failure(error_code::invalid_query,
                                "expected an address", data);
    }
    result.value = encoder_.encode(nonce_locked(*address));
    return result;
  }

  if (path == "/call") {
    return call_readonly(data);
  }

  if (path == "/events/range" || path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return make_query_failure(error_code::invalid_query,
                                "expected (from, to)", data);
    }
    auto [from, to] = *range;
    if (from > to) {
      return make_query_failure(error_code::invalid_query,
                                "range start exceeds range end", data);
    }
    to = clamp_range_end(from, to);

    if (path == "/events/range") {
      auto records = std::vector<event_record_t>{};
      for (auto id = from; id <= to && id < next_event_id_; ++id) {
        auto record = storage_.get<encoder_t, event_record_t>(
            encoder_, warden::schema::key::make_event_key(encoder_, id));
        if (record) {
          records.push_back(std::move(*record));
        }
      }
      result.value = encoder_.encode(records);
    } else {
      auto entries = std::vector<history_entry_t>{};
      auto last = static_cast<uint64_t>(last_committed_height_);
      for (auto height = std::max<uint64_t>(from, 1);
           height <= to && height <= last; ++height) {
        auto entry = storage_.get<encoder_t, history_entry_t>(
            encoder_, warden::schema::key::make_history_key(encoder_, height));
        if (entry) {
          entries.push_back(std::move(*entry));
        }
      }
      result.value = encoder_.encode(entries);
    }
    return result;
  }

  spdlog::warn("Unsupported query path '{}'", path);
  return make_query_failure(error_code::invalid_query,
                            "unsupported query path", data);
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  auto entries = std::vector<history_entry_t>{};
  auto last = static_cast<uint64_t>(last_committed_height_);
  for (auto height = std::max<uint64_t>(from_height, 1);
       height <= to_height && height <= last; ++height) {
    auto entry = storage_.get<encoder_t, history_entry_t>(
        encoder_, warden::schema::key::make_history_key(encoder_, height));
    if (entry) {
      entries.push_back(std::move(*entry));
    }
  }
  return entries;
}

std::vector<event_record_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto records = std::vector<event_record_t>{};
  for (auto id = from_id; id <= to_id && id < next_event_id_; ++id) {
    auto record = storage_.get<encoder_t, event_record_t>(
        encoder_, warden::schema::key::make_event_key(encoder_, id));
    if (record) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

std::optional<account_record_t> engine::account(
    const address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<encoder_t, account_record_t>(
      encoder_, warden::schema::key::make_account_key(encoder_, address));
}

uint64_t engine::nonce(const address_t& sender) const {
  auto lock = std::scoped_lock{mutex_};
  return nonce_locked(sender);
}

const hash32_t& engine::chain_id() const noexcept {
  return chain_id_;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_failure(error_code::unsupported_transaction_version,
                        "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_failure(error_code::invalid_chain_id,
                        "transaction targets another chain", codespace);
  }
  auto expected = nonce_locked(tx.sender);
  if (tx.nonce != expected) {
    return make_failure(error_code::invalid_nonce,
                        "expected nonce " + std::to_string(expected) +
                            ", got " + std::to_string(tx.nonce),
                        codespace);
  }
  auto result = transaction_result_t{};
  result.codespace = std::string{codespace};
  return result;
}

transaction_result_t engine::execute_validated(const transaction_t& tx,
                                               const bytes_t& raw_tx) {
  auto result = validate_transaction(tx, kExecuteCodespace);
  if (result.code != 0) {
    spdlog::warn("Rejected request from {}: {} ({})", to_hex(tx.sender),
                 result.log, result.info);
    return result;
  }

  auto height = static_cast<uint64_t>(last_committed_height_) + 1;
  auto work = warden::storage::unit_of_work{storage_};
  auto runtime = host{work,     registry_,           instances_,
                      chain_id_, signature_verifier_, height};
  auto deployed = instance_map_t{};

  try {
    result.data = execute_payload(runtime, tx);
    deployed = runtime.take_deployed();
  } catch (const protocol_error& e) {
    result = make_failure(e.code(), e.detail(), kExecuteCodespace);
  } catch (const std::exception& e) {
    result = make_failure(error_code::dispatch_failed, e.what(),
                          kExecuteCodespace);
  }

  auto next_event_id = next_event_id_;
  if (result.code != 0) {
    spdlog::info("Request from {} at height {} failed: {} ({})",
                 to_hex(tx.sender), height, result.log, result.info);
    work.discard();
  } else {
    for (const auto& emitted : work.events()) {
      result.events.push_back(emitted.event);
      work.put(warden::schema::key::make_event_key(encoder_, next_event_id),
               event_record_t{.event_id = next_event_id,
                              .height = height,
                              .emitter = emitted.emitter,
                              .event = emitted.event});
      ++next_event_id;
    }
    work.put(warden::schema::key::make_event_sequence_key(encoder_),
             next_event_id);
  }

  work.put(warden::schema::key::make_nonce_key(encoder_, tx.sender),
           tx.nonce + 1);
  work.put(warden::schema::key::make_history_key(encoder_, height),
           history_entry_t{.height = height, .code = result.code, .tx = raw_tx});

  auto state_root = fold_state_root(last_committed_state_root_, raw_tx, height,
                                    result.code);
  work.commit();
  storage_.save_committed_state(warden::storage::committed_state{
      .height = static_cast<int64_t>(height), .state_root = state_root});

  last_committed_height_ = static_cast<int64_t>(height);
  last_committed_state_root_ = state_root;
  next_event_id_ = next_event_id;
  instances_.merge(deployed);
  return result;
}

bytes_t engine::execute_payload(host& runtime, const transaction_t& tx) {
  auto root = host::make_root_frame(tx.sender);
  auto data = bytes_t{};
  std::visit(
      overloaded{
          [&](const call_t& payload) {
            data = runtime.call(root, payload.to, make_amount(payload.value),
                                payload.data);
          },
          [&](const deploy_t& payload) {
            data = encoder_.encode(runtime.deploy(root, payload.code,
                                                  payload.constructor_args));
          },
          [&](const deploy_proxy_t& payload) {
            data = encoder_.encode(
                runtime.deploy_proxy(root, payload.implementation,
                                     payload.proxy_admin,
                                     payload.initialize_data));
          },
          [&](const upgrade_proxy_t& payload) {
            data = runtime.upgrade_proxy(root, payload.proxy,
                                         payload.implementation, payload.data);
          }},
      tx.payload);
  return data;
}

query_result_t engine::call_readonly(const bytes_view_t& data) {
  auto request =
      encoder_.try_decode<std::tuple<address_t, address_t, bytes_t>>(data);
  if (!request) {
    return make_query_failure(error_code::invalid_query,
                              "expected (from, to, data)", data);
  }
  const auto& [from, to, call_data] = *request;

  auto work = warden::storage::unit_of_work{storage_};
  auto runtime = host{work,
                      registry_,
                      instances_,
                      chain_id_,
                      signature_verifier_,
                      static_cast<uint64_t>(last_committed_height_)};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};
  try {
    result.value =
        runtime.static_call(host::make_root_frame(from), to, call_data);
  } catch (const protocol_error& e) {
    return make_query_failure(e.code(), e.detail(), data);
  } catch (const std::exception& e) {
    return make_query_failure(error_code::dispatch_failed, e.what(), data);
  }
  return result;
}

uint64_t engine::nonce_locked(const address_t& sender) const {
  return storage_
      .get<encoder_t, uint64_t>(
          encoder_, warden::schema::key::make_nonce_key(encoder_, sender))
      .value_or(0);
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }
  next_event_id_ =
      storage_
          .get<encoder_t, uint64_t>(
              encoder_,
              warden::schema::key::make_event_sequence_key(encoder_))
          .value_or(0);

  auto prefix = encoder_.encode(warden::schema::key::kAccountKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto parsed = encoder_.try_decode<std::tuple<std::string, address_t>>(
        bytes_view_t{key.data(), key.size()});
    auto record = encoder_.try_decode<account_record_t>(
        bytes_view_t{value.data(), value.size()});
    if (!parsed || !record) {
      warden::common::critical("persisted account record failed to decode");
    }
    if (record->kind != account_kind_t::contract) {
      continue;
    }
    const auto& address = std::get<1>(*parsed);
    const auto* factory = registry_.find(record->code);
    if (factory == nullptr) {
      spdlog::warn("No code '{}' registered for account {}", record->code,
                   to_hex(address));
      continue;
    }
    instances_.insert_or_assign(
        address, (*factory)(address, bytes_view_t{record->constructor_args.data(),
                                                  record->constructor_args.size()}));
  }
}

}  // namespace warden::execution
