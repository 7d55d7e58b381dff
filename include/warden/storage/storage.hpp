#pragma once
#include <warden/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace warden::storage {

using key_value_entry_t =
    std::pair<warden::schema::bytes_t, warden::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  warden::schema::hash32_t state_root;
};

/// Writes of one request, applied atomically by `commit_batch`.
struct write_set final {
  std::vector<key_value_entry_t> puts;
  std::vector<warden::schema::bytes_t> erasures;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const warden::schema::bytes_view_t& key,
           const T& value);

  /// Return the raw bytes at key, or std::nullopt when missing.
  std::optional<warden::schema::bytes_t> read(
      const warden::schema::bytes_view_t& key) const;

  /// Apply every put and erasure of `writes` in a single atomic batch.
  void commit_batch(const write_set& writes) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace warden::storage
