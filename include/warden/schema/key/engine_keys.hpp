#pragma once

#include <warden/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for accounts, contract storage,
// nonces, history and events.
namespace warden::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kDeployNonceKeyPrefix{
    "SYS|STATE|DEPLOY_NONCE|"};
inline constexpr std::string_view kSlotKeyPrefix{"SYS|STATE|SLOT|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline constexpr std::array<std::string_view, 8> kEngineKeyspaces{
    kStatePrefix,          kAccountKeyPrefix,  kNonceKeyPrefix,
    kDeployNonceKeyPrefix, kSlotKeyPrefix,     kEventSeqKeyPrefix,
    kHistoryPrefix,        kEventPrefix};

template <typename Encoder, typename T>
warden::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
warden::schema::bytes_t make_account_key(
    Encoder& encoder,
    const warden::schema::address_t& address) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, address);
}

template <typename Encoder>
warden::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const warden::schema::address_t& address) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, address);
}

template <typename Encoder>
warden::schema::bytes_t make_deploy_nonce_key(
    Encoder& encoder,
    const warden::schema::address_t& deployer) {
  return make_prefixed_key(encoder, kDeployNonceKeyPrefix, deployer);
}

/// Storage slot of `account`; `slot` is the SCALE encoding of the
/// contract-level slot key.
template <typename Encoder>
warden::schema::bytes_t make_slot_key(
    Encoder& encoder,
    const warden::schema::address_t& account,
    const warden::schema::bytes_t& slot) {
  return make_prefixed_key(encoder, kSlotKeyPrefix, std::tuple{account, slot});
}

template <typename Encoder>
warden::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
warden::schema::bytes_t make_history_key(Encoder& encoder, uint64_t height) {
  return make_prefixed_key(encoder, kHistoryPrefix, height);
}

template <typename Encoder>
warden::schema::bytes_t make_event_key(Encoder& encoder, uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

/// Recover the height from a history key, or std::nullopt for other keys.
std::optional<uint64_t> parse_history_key(
    const warden::schema::bytes_view_t& key);

/// Recover the event id from an event key, or std::nullopt for other keys.
std::optional<uint64_t> parse_event_key(
    const warden::schema::bytes_view_t& key);

}  // namespace warden::schema::key
