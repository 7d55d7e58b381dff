#pragma once

#include <warden/schema/authorization_status.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/registration_status.hpp>
#include <cstdint>

// Schema type: integration record.
// Ledger entry keyed by an integration's self-identity. `host` is the
// front-facing account (the integration itself, or its proxy) bound by the
// first pre-registration; only that account running the identity's code may
// write the entry.
namespace warden::schema {

template <uint16_t Version>
struct integration_record;

template <>
struct integration_record<1> final {
  uint16_t version{1};
  address_t host{};
  registration_status_t registration{registration_status_t::unregistered};
  authorization_status_t authorization{authorization_status_t::inactive};
};

using integration_record_t = integration_record<1>;

}  // namespace warden::schema
