#pragma once

#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: account record.
// A contract account names the code unit and the constructor arguments used
// to instantiate it; a proxy account forwards execution to its
// implementation while keeping its own storage.
namespace warden::schema {

enum class account_kind_t : uint8_t { contract = 0, proxy = 1 };

inline constexpr auto kAccountKindMappings = std::array{
    std::pair<std::string_view, account_kind_t>{"contract",
                                                account_kind_t::contract},
    std::pair<std::string_view, account_kind_t>{"proxy",
                                                account_kind_t::proxy}};

template <>
inline std::optional<account_kind_t> try_from_string<account_kind_t>(
    const std::string_view value) {
  return from_string(value, kAccountKindMappings);
}

inline constexpr std::string_view to_string(const account_kind_t value) {
  return to_string(value, kAccountKindMappings).value_or("unknown");
}

template <uint16_t Version>
struct account_record;

template <>
struct account_record<1> final {
  uint16_t version{1};
  account_kind_t kind{account_kind_t::contract};
  std::string code;
  bytes_t constructor_args;
  address_t deployer{};
  std::optional<address_t> implementation;
  std::optional<address_t> proxy_admin;
};

using account_record_t = account_record<1>;

}  // namespace warden::schema
