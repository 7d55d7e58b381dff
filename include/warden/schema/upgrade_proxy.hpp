#pragma once
#include <warden/schema/primitives.hpp>

// Schema type: upgrade proxy.
// Swap the implementation behind `proxy` (proxy admin only); `data`, when
// non-empty, is executed through the proxy after the swap.
namespace warden::schema {

template <uint16_t Version>
struct upgrade_proxy;

template <>
struct upgrade_proxy<1> final {
  uint16_t version{1};
  address_t proxy{};
  address_t implementation{};
  bytes_t data;
};

using upgrade_proxy_t = upgrade_proxy<1>;

}  // namespace warden::schema
