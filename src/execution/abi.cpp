#include <warden/blake3/hash.hpp>
#include <warden/execution/abi.hpp>

#include <algorithm>

namespace warden::execution::abi {

warden::schema::selector_t make_selector(const std::string_view signature) {
  auto digest = warden::blake3::hash(signature);
  auto selector = warden::schema::selector_t{};
  std::copy_n(std::begin(digest), selector.size(), std::begin(selector));
  return selector;
}

std::optional<warden::schema::selector_t> selector_of(
    const warden::schema::bytes_view_t& data) {
  if (data.size() < kSelectorSize) {
    return std::nullopt;
  }
  auto selector = warden::schema::selector_t{};
  std::copy_n(std::begin(data), selector.size(), std::begin(selector));
  return selector;
}

warden::schema::bytes_view_t arguments_of(
    const warden::schema::bytes_view_t& data) {
  if (data.size() < kSelectorSize) {
    return {};
  }
  return data.subspan(kSelectorSize);
}

}  // namespace warden::execution::abi
