#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_event.hpp>
#include <cstdint>

// Schema type: event record.
// Persisted notification of a committed request, ordered by event id.
namespace warden::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  address_t emitter{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace warden::schema
