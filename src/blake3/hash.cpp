#include <warden/blake3/hash.hpp>

namespace warden::blake3 {

warden::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

warden::schema::hash32_t hash(const warden::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const warden::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

warden::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN
  auto output = warden::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

}  // namespace warden::blake3
