#pragma once

#include <warden/execution/call_frame.hpp>
#include <warden/execution/code_registry.hpp>
#include <warden/execution/contract.hpp>
#include <warden/execution/signature_verifier.hpp>
#include <warden/schema/account_record.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_event.hpp>
#include <warden/storage/unit_of_work.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string_view>

namespace warden::execution {

using instance_map_t =
    std::map<warden::schema::address_t, std::shared_ptr<contract>>;

inline constexpr auto kMaxCallDepth = uint32_t{64};

/// Address of the `nonce`-th account deployed by `deployer`:
/// the first 20 bytes of BLAKE3(SCALE{"warden-address-v1", deployer, nonce}).
warden::schema::address_t make_contract_address(
    const warden::schema::address_t& deployer,
    uint64_t nonce);

/// Execution environment of one request.
///
/// Every storage access, nested call and deployment made by running code goes
/// through the host, which routes it into the request's unit of work. A nested
/// call that fails restores the unit of work to the state it had before the
/// call and rethrows.
class host final {
 public:
  host(warden::storage::unit_of_work& work,
       const code_registry& registry,
       const instance_map_t& instances,
       const warden::schema::hash32_t& chain_id,
       const signature_verifier_t& verifier,
       uint64_t height);

  host(const host&) = delete;
  host& operator=(const host&) = delete;

  /// Frame of an external account at the root of a request.
  static call_frame make_root_frame(const warden::schema::address_t& sender);

  warden::schema::bytes_t call(const call_frame& caller,
                               const warden::schema::address_t& to,
                               const warden::schema::amount_t& value,
                               const warden::schema::bytes_t& data);

  /// Like `call`, but the callee and everything it calls may not write.
  warden::schema::bytes_t static_call(const call_frame& caller,
                                      const warden::schema::address_t& to,
                                      const warden::schema::bytes_t& data);

  /// Run the code of `code` against the caller's storage, sender and value.
  warden::schema::bytes_t delegate_call(const call_frame& caller,
                                        const warden::schema::address_t& code,
                                        const warden::schema::bytes_t& data);

  warden::schema::address_t deploy(
      const call_frame& caller,
      std::string_view code,
      const warden::schema::bytes_t& constructor_args);

  warden::schema::address_t deploy_proxy(
      const call_frame& caller,
      const warden::schema::address_t& implementation,
      const warden::schema::address_t& proxy_admin,
      const warden::schema::bytes_t& initialize_data);

  /// Swap the implementation behind `proxy`; the caller must be its admin.
  warden::schema::bytes_t upgrade_proxy(
      const call_frame& caller,
      const warden::schema::address_t& proxy,
      const warden::schema::address_t& implementation,
      const warden::schema::bytes_t& data);

  std::optional<warden::schema::bytes_t> load(
      const call_frame& frame,
      const warden::schema::bytes_t& slot) const;
  void store(const call_frame& frame,
             const warden::schema::bytes_t& slot,
             const warden::schema::bytes_t& value);
  void erase(const call_frame& frame, const warden::schema::bytes_t& slot);

  template <typename T>
  std::optional<T> load_as(const call_frame& frame,
                           const warden::schema::bytes_t& slot) const;
  template <typename T>
  void store_as(const call_frame& frame,
                const warden::schema::bytes_t& slot,
                const T& value);

  void emit(const call_frame& frame, warden::schema::transaction_event_t event);

  std::optional<warden::schema::account_record_t> account(
      const warden::schema::address_t& address) const;

  /// Implementation behind a proxy account, or std::nullopt for non-proxies.
  std::optional<warden::schema::address_t> implementation_of(
      const warden::schema::address_t& address) const;

  const warden::schema::hash32_t& chain_id() const noexcept;
  uint64_t height() const noexcept;

  bool verify_registrar_signature(
      const warden::schema::bytes_view_t& message,
      const warden::schema::registrar_key_t& registrar_key,
      const warden::schema::registrar_signature_t& signature) const;

  /// Logic units deployed by this request, merged by the engine on commit.
  instance_map_t take_deployed();

 private:
  using encoder_t = warden::schema::encoding::encoder<
      warden::schema::encoding::scale_encoder_tag>;

  std::shared_ptr<contract> instance_for(
      const warden::schema::address_t& code) const;
  warden::schema::address_t resolve_code(
      const warden::schema::address_t& address) const;
  warden::schema::address_t next_address(
      const warden::schema::address_t& deployer);
  void write_account(const warden::schema::address_t& address,
                     const warden::schema::account_record_t& record);
  warden::schema::bytes_t run(const call_frame& frame);
  void require_writable(const call_frame& frame) const;

  warden::storage::unit_of_work& work_;
  const code_registry& registry_;
  const instance_map_t& instances_;
  instance_map_t deployed_;
  warden::schema::hash32_t chain_id_;
  const signature_verifier_t& verifier_;
  uint64_t height_{};
};

template <typename T>
std::optional<T> host::load_as(const call_frame& frame,
                               const warden::schema::bytes_t& slot) const {
  auto raw = load(frame, slot);
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return encoder.try_decode<T>(
      warden::schema::bytes_view_t{raw->data(), raw->size()});
}

template <typename T>
void host::store_as(const call_frame& frame,
                    const warden::schema::bytes_t& slot,
                    const T& value) {
  auto encoder = encoder_t{};
  store(frame, slot, encoder.encode(value));
}

}  // namespace warden::execution
