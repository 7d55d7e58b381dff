#include <warden/schema/key/engine_keys.hpp>

#include <warden/schema/encoding/scale/encoder.hpp>

#include <string>
#include <tuple>

namespace warden::schema::key {

namespace {

using key_encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

std::optional<uint64_t> parse_u64_key(const warden::schema::bytes_view_t& key,
                                      const std::string_view prefix) {
  auto encoder = key_encoder_t{};
  auto decoded = encoder.try_decode<std::tuple<std::string, uint64_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != prefix) {
    return std::nullopt;
  }
  return std::get<1>(decoded.value());
}

}  // namespace

std::optional<uint64_t> parse_history_key(
    const warden::schema::bytes_view_t& key) {
  return parse_u64_key(key, kHistoryPrefix);
}

std::optional<uint64_t> parse_event_key(
    const warden::schema::bytes_view_t& key) {
  return parse_u64_key(key, kEventPrefix);
}

}  // namespace warden::schema::key
