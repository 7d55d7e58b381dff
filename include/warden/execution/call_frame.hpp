#pragma once

#include <warden/schema/primitives.hpp>

namespace warden::execution {

/// Context of one executing invocation.
///
/// `self` is the account whose storage is in effect and `code` the account
/// whose logic runs. They differ when a proxy forwards or when code is run
/// through `host::delegate_call`. `sender_code` is the logic that issued the
/// call, which lets a callee authenticate the caller's self-identity even when
/// it arrives through a proxy.
struct call_frame final {
  warden::schema::address_t sender{};
  warden::schema::address_t sender_code{};
  warden::schema::address_t self{};
  warden::schema::address_t code{};
  warden::schema::amount_t value{};
  warden::schema::bytes_t data;
  bool read_only{};
  uint32_t depth{};
};

}  // namespace warden::execution
