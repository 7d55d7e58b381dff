#pragma once

#include <warden/protocol/integration.hpp>

namespace warden::protocol {

/// Integration deployed directly, without a proxy in front of it.
///
/// The deployer becomes security admin and the identity is pre-registered
/// during construction. Protection flags live in the integration's own
/// storage, and any call that runs this code against other storage fails with
/// DelegationNotPermitted.
class standalone_integration : public integration {
 public:
  using integration::integration;

  void construct(warden::execution::host& runtime,
                 const warden::execution::call_frame& frame) override;

 protected:
  void check_identity(warden::execution::host& runtime,
                      const warden::execution::call_frame& frame) const override;

  bool protection_enabled(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const warden::schema::selector_t& selector) const override;

  std::vector<bool> protection_status(
      warden::execution::host& runtime,
      const warden::execution::call_frame& frame,
      const std::vector<warden::schema::selector_t>& selectors) const override;

  void write_protection(warden::execution::host& runtime,
                        const warden::execution::call_frame& frame,
                        const std::vector<warden::schema::selector_t>& selectors,
                        const std::vector<bool>& flags) const override;
};

}  // namespace warden::protocol
