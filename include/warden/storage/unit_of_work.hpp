#pragma once
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_event.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace warden::storage {

/// Event emitted during a request, attributed to the emitting account.
struct emitted_event final {
  warden::schema::address_t emitter{};
  warden::schema::transaction_event_t event;
};

/// Buffered writes and events of one request.
///
/// Reads see the request's own writes first, then committed storage. Nothing
/// reaches storage until `commit`; dropping the object discards the request.
class unit_of_work final {
 public:
  /// Restorable position inside the buffered request state.
  struct savepoint final {
    std::map<warden::schema::bytes_t, std::optional<warden::schema::bytes_t>>
        writes;
    std::size_t event_count{};
  };

  explicit unit_of_work(const storage<rocksdb_storage_tag>& base);

  std::optional<warden::schema::bytes_t> read(
      const warden::schema::bytes_view_t& key) const;
  void write(const warden::schema::bytes_t& key, warden::schema::bytes_t value);
  void erase(const warden::schema::bytes_t& key);

  template <typename T>
  std::optional<T> get(const warden::schema::bytes_t& key) const;
  template <typename T>
  void put(const warden::schema::bytes_t& key, const T& value);

  void emit(const warden::schema::address_t& emitter,
            warden::schema::transaction_event_t event);
  const std::vector<emitted_event>& events() const noexcept;

  savepoint mark() const;
  void restore(savepoint point);

  /// Drop every buffered write and event.
  void discard();

  bool empty() const noexcept;
  write_set make_write_set() const;

  /// Apply the buffered writes to storage in one batch.
  void commit() const;

 private:
  using encoder_t = warden::schema::encoding::encoder<
      warden::schema::encoding::scale_encoder_tag>;

  const storage<rocksdb_storage_tag>& base_;
  std::map<warden::schema::bytes_t, std::optional<warden::schema::bytes_t>>
      writes_;
  std::vector<emitted_event> events_;
};

template <typename T>
std::optional<T> unit_of_work::get(const warden::schema::bytes_t& key) const {
  auto raw = read(warden::schema::bytes_view_t{key.data(), key.size()});
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<T>(
      warden::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    warden::common::critical("stored value failed to decode");
  }
  return decoded;
}

template <typename T>
void unit_of_work::put(const warden::schema::bytes_t& key, const T& value) {
  auto encoder = encoder_t{};
  write(key, encoder.encode(value));
}

}  // namespace warden::storage
