#pragma once
#include <warden/schema/primitives.hpp>

// Schema type: call.
// Invoke `to` with invocation data (selector ++ SCALE arguments) and an
// attached value.
namespace warden::schema {

template <uint16_t Version>
struct call;

template <>
struct call<1> final {
  uint16_t version{1};
  address_t to{};
  word_t value{};
  bytes_t data;
};

using call_t = call<1>;

}  // namespace warden::schema
