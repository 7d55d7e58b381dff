#pragma once

#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: module record.
// Router registry entry for an installed security module, keyed by module id.
namespace warden::schema {

template <uint16_t Version>
struct module_record;

template <>
struct module_record<1> final {
  uint16_t version{1};
  address_t module{};
  std::string module_version;
  bool deprecated{};
};

using module_record_t = module_record<1>;

}  // namespace warden::schema
