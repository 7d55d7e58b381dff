#pragma once
#include <warden/schema/primitives.hpp>

// Schema type: deploy proxy.
// Create a proxy account fronting `implementation`; `initialize_data`, when
// non-empty, is executed through the new proxy in the same request.
namespace warden::schema {

template <uint16_t Version>
struct deploy_proxy;

template <>
struct deploy_proxy<1> final {
  uint16_t version{1};
  address_t implementation{};
  address_t proxy_admin{};
  bytes_t initialize_data;
};

using deploy_proxy_t = deploy_proxy<1>;

}  // namespace warden::schema
