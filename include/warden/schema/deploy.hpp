#pragma once
#include <warden/schema/primitives.hpp>
#include <string>

// Schema type: deploy.
// Instantiate a registered code unit at a fresh address and run its
// constructor.
namespace warden::schema {

template <uint16_t Version>
struct deploy;

template <>
struct deploy<1> final {
  uint16_t version{1};
  std::string code;
  bytes_t constructor_args;
};

using deploy_t = deploy<1>;

}  // namespace warden::schema
