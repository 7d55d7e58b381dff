#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using selector_t = std::array<uint8_t, 4>;
using module_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;

/// 256-bit big-endian word, used wherever an amount crosses an encoding
/// boundary.
using word_t = hash32_t;

/// Compressed secp256k1 public key of the registrar.
using registrar_key_t = std::array<uint8_t, 33>;
/// 65-byte secp256k1 registrar signature, [v || r || s] or [r || s || v].
using registrar_signature_t = std::array<uint8_t, 65>;

inline constexpr auto kRegistrarSignatureSize = std::size_t{65};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_zero_address();
bool is_zero(const address_t& address);

std::optional<registrar_key_t> try_make_registrar_key(
    const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const address_t& address);
std::string to_hex(const selector_t& selector);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

word_t make_word(const amount_t& amount);
amount_t make_amount(const word_t& word);

}  // namespace warden::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
