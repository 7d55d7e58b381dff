#pragma once

#include <warden/protocol/integration.hpp>

namespace warden::protocol {

/// Integration logic unit meant to sit behind a proxy.
///
/// Protection flags are read from and written to the GateKeeper under the
/// logic unit's own address, never kept in the proxy's storage, so a
/// replacement logic unit cannot inherit them by aliasing storage. The proxy
/// must be initialized with `initialize(admin)` before registration.
class proxy_integration : public integration {
 public:
  proxy_integration(const warden::schema::address_t& self,
                    const warden::schema::bytes_view_t& constructor_args);

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
