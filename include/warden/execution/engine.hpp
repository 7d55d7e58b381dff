#pragma once

#include <warden/execution/code_registry.hpp>
#include <warden/execution/host.hpp>
#include <warden/execution/signature_verifier.hpp>
#include <warden/schema/account_record.hpp>
#include <warden/schema/app_info.hpp>
#include <warden/schema/encoding/encoder.hpp>
#include <warden/schema/event_record.hpp>
#include <warden/schema/history_entry.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/query_result.hpp>
#include <warden/schema/transaction.hpp>
#include <warden/schema/transaction_result.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace warden::execution {

inline constexpr auto kCheckCodespace = std::string_view{"warden.checktx"};
inline constexpr auto kExecuteCodespace = std::string_view{"warden.execute"};
inline constexpr auto kQueryCodespace = std::string_view{"warden.query"};

/// Upper bound on entries returned by one range query.
inline constexpr auto kMaxQueryRange = uint64_t{1000};

/// Last id served for the inclusive range [from, to]; requires from <= to.
constexpr uint64_t clamp_range_end(const uint64_t from, const uint64_t to) {
  return to - from >= kMaxQueryRange ? from + kMaxQueryRange - 1 : to;
}

/// Deterministic contract host behind the node.
///
/// Requests are executed one at a time. Each runs in its own unit of work that
/// is committed in a single storage batch on success and discarded on failure;
/// the sender nonce, history entry and state root advance either way.
class engine final {
 public:
  using encoder_t = warden::schema::encoding::encoder<
      warden::schema::encoding::scale_encoder_tag>;
  using storage_t =
      warden::storage::storage<warden::storage::rocksdb_storage_tag>;

  /// Construct the engine over `storage`, re-instantiating every persisted
  /// contract account from `registry`.
  engine(encoder_t& encoder,
         storage_t& storage,
         const warden::schema::hash32_t& chain_id,
         code_registry registry);

  /// Decode and validate a request without executing it.
  warden::schema::transaction_result_t check_transaction(
      const warden::schema::bytes_view_t& raw_tx) const;

  /// Execute one encoded request.
  warden::schema::transaction_result_t execute(
      const warden::schema::bytes_view_t& raw_tx);

  /// Execute one request.
  warden::schema::transaction_result_t execute(
      const warden::schema::transaction_t& tx);

  /// Return application metadata (latest committed height and state_root).
  warden::schema::app_info_t info() const;

  /// Execute a deterministic read-path query by route.
  warden::schema::query_result_t query(
      std::string_view path,
      const warden::schema::bytes_view_t& data);

  /// Return history entries in the inclusive height range.
  std::vector<warden::schema::history_entry_t> history(uint64_t from_height,
                                                       uint64_t to_height) const;

  /// Return committed events in the inclusive event id range.
  std::vector<warden::schema::event_record_t> events(uint64_t from_id,
                                                     uint64_t to_id) const;

  std::optional<warden::schema::account_record_t> account(
      const warden::schema::address_t& address) const;

  /// Next nonce expected from `sender`.
  uint64_t nonce(const warden::schema::address_t& sender) const;

  const warden::schema::hash32_t& chain_id() const noexcept;

  /// Install the registrar credential verifier.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  warden::schema::transaction_result_t validate_transaction(
      const warden::schema::transaction_t& tx,
      std::string_view codespace) const;

  warden::schema::transaction_result_t execute_validated(
      const warden::schema::transaction_t& tx,
      const warden::schema::bytes_t& raw_tx);

  warden::schema::bytes_t execute_payload(
      host& runtime,
      const warden::schema::transaction_t& tx);

  warden::schema::query_result_t call_readonly(
      const warden::schema::bytes_view_t& data);

  uint64_t nonce_locked(const warden::schema::address_t& sender) const;

  /// Load committed state and logic units from storage at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  warden::schema::hash32_t chain_id_;
  code_registry registry_;
  instance_map_t instances_;
  signature_verifier_t signature_verifier_;
  int64_t last_committed_height_{};
  warden::schema::hash32_t last_committed_state_root_{};
  uint64_t next_event_id_{};
};

}  // namespace warden::execution
