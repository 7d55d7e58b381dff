#pragma once

#include <warden/execution/protocol_error.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string_view>
#include <tuple>

// Invocation data is `selector ++ SCALE(std::tuple{args...})`; return data is
// the SCALE encoding of the single return value.
namespace warden::execution::abi {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

inline constexpr auto kSelectorSize = std::size_t{4};

/// First four bytes of BLAKE3(signature), e.g. "updateFlags(address,bytes4[],bool[])".
warden::schema::selector_t make_selector(std::string_view signature);

/// Leading selector of invocation data, or std::nullopt when shorter than 4.
std::optional<warden::schema::selector_t> selector_of(
    const warden::schema::bytes_view_t& data);

/// Argument bytes that follow the selector.
warden::schema::bytes_view_t arguments_of(
    const warden::schema::bytes_view_t& data);

template <typename... Args>
warden::schema::bytes_t encode_call(const warden::schema::selector_t& selector,
                                    const Args&... args) {
  auto data =
      warden::schema::bytes_t{std::begin(selector), std::end(selector)};
  if constexpr (sizeof...(Args) > 0) {
    auto encoder = encoder_t{};
    encoder.encode(std::tuple<Args...>{args...}, data);
  }
  return data;
}

template <typename... Args>
warden::schema::bytes_t encode_call(const std::string_view signature,
                                    const Args&... args) {
  return encode_call(make_selector(signature), args...);
}

/// Decode call arguments; malformed bytes fail with InvalidCalldata.
template <typename... Args>
std::tuple<Args...> decode_arguments(const warden::schema::bytes_view_t& args) {
  if constexpr (sizeof...(Args) == 0) {
    return {};
  } else {
    auto encoder = encoder_t{};
    auto decoded = encoder.try_decode<std::tuple<Args...>>(args);
    require(decoded.has_value(), warden::schema::error_code::invalid_calldata,
            "argument decoding failed");
    return std::move(*decoded);
  }
}

/// Contract storage slot key: SCALE(std::tuple{name, parts...}).
template <typename... Parts>
warden::schema::bytes_t make_slot(const std::string_view name,
                                  const Parts&... parts) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple<std::string_view, Parts...>{name, parts...});
}

template <typename T>
warden::schema::bytes_t encode_result(const T& value) {
  auto encoder = encoder_t{};
  return encoder.encode(value);
}

template <typename T>
std::optional<T> try_decode_result(const warden::schema::bytes_view_t& data) {
  auto encoder = encoder_t{};
  return encoder.try_decode<T>(data);
}

/// Decode a callee's return data; malformed bytes fail with InvalidCalldata.
template <typename T>
T decode_result(const warden::schema::bytes_view_t& data) {
  auto decoded = try_decode_result<T>(data);
  require(decoded.has_value(), warden::schema::error_code::invalid_calldata,
          "return data decoding failed");
  return std::move(*decoded);
}

}  // namespace warden::execution::abi
