#pragma once

#include <warden/execution/call_frame.hpp>
#include <warden/schema/primitives.hpp>

#include <string>
#include <string_view>

namespace warden::execution {
class host;
}

namespace warden::protocol {

/// Two-step administrator hand-over kept in the storage of the calling
/// contract.
///
/// The current admin nominates a successor; only the nominee can accept, which
/// promotes it and clears the nomination. There is no way to leave the role
/// empty once initialized.
class admin_transfer final {
 public:
  /// `role` names the storage slots, so one contract may hold several roles.
  explicit admin_transfer(std::string_view role);

  /// Set the first admin. Fails with ZeroAddress for the zero address.
  void initialize(warden::execution::host& runtime,
                  const warden::execution::call_frame& frame,
                  const warden::schema::address_t& admin) const;

  warden::schema::address_t admin(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame) const;
  warden::schema::address_t pending_admin(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame) const;

  bool is_admin(warden::execution::host& runtime,
                const warden::execution::call_frame& frame,
                const warden::schema::address_t& account) const;

  /// Fails with CallerNotAdmin unless the frame's sender is the admin.
  void require_admin(warden::execution::host& runtime,
                     const warden::execution::call_frame& frame) const;

  /// Nominate `new_admin`; the zero address withdraws a nomination.
  void transfer(warden::execution::host& runtime,
                const warden::execution::call_frame& frame,
                const warden::schema::address_t& new_admin) const;

  /// Promote the nominee. Fails with NotPendingAdmin for anyone else.
  void accept(warden::execution::host& runtime,
              const warden::execution::call_frame& frame) const;

 private:
  std::string role_;
  warden::schema::bytes_t admin_slot_;
  warden::schema::bytes_t pending_slot_;
};

}  // namespace warden::protocol
