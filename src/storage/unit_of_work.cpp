#include <warden/storage/unit_of_work.hpp>

#include <algorithm>
#include <utility>

namespace warden::storage {

unit_of_work::unit_of_work(const storage<rocksdb_storage_tag>& base)
    : base_{base} {}

std::optional<warden::schema::bytes_t> unit_of_work::read(
    const warden::schema::bytes_view_t& key) const {
  auto it = writes_.find(warden::schema::make_bytes(key));
  if (it != std::end(writes_)) {
    return it->second;
  }
  return base_.read(key);
}

void unit_of_work::write(const warden::schema::bytes_t& key,
                         warden::schema::bytes_t value) {
  writes_[key] = std::move(value);
}

void unit_of_work::erase(const warden::schema::bytes_t& key) {
  writes_[key] = std::nullopt;
}

void unit_of_work::emit(const warden::schema::address_t& emitter,
                        warden::schema::transaction_event_t event) {
  events_.push_back(emitted_event{.emitter = emitter, .event = std::move(event)});
}

const std::vector<emitted_event>& unit_of_work::events() const noexcept {
  return events_;
}

unit_of_work::savepoint unit_of_work::mark() const {
  return savepoint{.writes = writes_, .event_count = events_.size()};
}

void unit_of_work::restore(savepoint point) {
  writes_ = std::move(point.writes);
  events_.resize(std::min(point.event_count, events_.size()));
}

void unit_of_work::discard() {
  writes_.clear();
  events_.clear();
}

bool unit_of_work::empty() const noexcept {
  return writes_.empty() && events_.empty();
}

write_set unit_of_work::make_write_set() const {
  auto writes = write_set{};
  for (const auto& [key, value] : writes_) {
    if (value.has_value()) {
      writes.puts.emplace_back(key, *value);
    } else {
      writes.erasures.push_back(key);
    }
  }
  return writes;
}

void unit_of_work::commit() const {
  if (writes_.empty()) {
    return;
  }
  base_.commit_batch(make_write_set());
}

}  // namespace warden::storage
