#pragma once
#include <blake3.h>
#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace warden::blake3 {

warden::schema::hash32_t hash(const std::string_view& str);
warden::schema::hash32_t hash(const warden::schema::bytes_view_t& bytes);

/// Incremental BLAKE3 state for digests assembled from several pieces.
class hasher final {
 public:
  hasher();

  hasher& update(const warden::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);
  warden::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

}  // namespace warden::blake3
