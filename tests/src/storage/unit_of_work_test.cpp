#include <gtest/gtest.h>
#include <warden/storage/rocksdb/storage.hpp>
#include <warden/storage/unit_of_work.hpp>
#include <warden/testing/common.hpp>

#include <string>

using namespace warden::schema;
using warden::storage::rocksdb_storage_tag;
using warden::storage::unit_of_work;

namespace {

class unit_of_work_test : public ::testing::Test {
 protected:
  unit_of_work_test()
      : db_path_{warden::testing::make_db_path("warden_unit_of_work")},
        storage_{warden::storage::make_storage<rocksdb_storage_tag>(db_path_)} {}

  ~unit_of_work_test() override { warden::testing::remove_path(db_path_); }

  static bytes_t key(const std::string& value) { return make_bytes(value); }

  std::optional<bytes_t> stored(const std::string& value) const {
    auto raw = key(value);
    return storage_.read(bytes_view_t{raw.data(), raw.size()});
  }

  std::string db_path_;
  warden::storage::storage<rocksdb_storage_tag> storage_;
};

transaction_event_t make_event(const std::string& type) {
  return transaction_event_t{.type = type};
}

}  // namespace

TEST_F(unit_of_work_test, reads_own_writes_before_storage) {
  auto seed = unit_of_work{storage_};
  seed.write(key("a"), bytes_t{1});
  seed.commit();

  auto work = unit_of_work{storage_};
  auto raw = key("a");
  EXPECT_EQ(work.read(bytes_view_t{raw.data(), raw.size()}), bytes_t{1});
  work.write(key("a"), bytes_t{2});
  EXPECT_EQ(work.read(bytes_view_t{raw.data(), raw.size()}), bytes_t{2});
  EXPECT_EQ(stored("a"), bytes_t{1});
}

TEST_F(unit_of_work_test, erase_hides_committed_value) {
  auto seed = unit_of_work{storage_};
  seed.write(key("a"), bytes_t{1});
  seed.commit();

  auto work = unit_of_work{storage_};
  work.erase(key("a"));
  auto raw = key("a");
  EXPECT_FALSE(work.read(bytes_view_t{raw.data(), raw.size()}).has_value());
  work.commit();
  EXPECT_FALSE(stored("a").has_value());
}

TEST_F(unit_of_work_test, dropping_without_commit_leaves_storage_untouched) {
  {
    auto work = unit_of_work{storage_};
    work.write(key("a"), bytes_t{1});
  }
  EXPECT_FALSE(stored("a").has_value());
}

TEST_F(unit_of_work_test, restore_rewinds_writes_and_events) {
  auto work = unit_of_work{storage_};
  work.write(key("a"), bytes_t{1});
  work.emit(warden::testing::make_account(1), make_event("first"));

  auto point = work.mark();
  work.write(key("a"), bytes_t{2});
  work.write(key("b"), bytes_t{3});
  work.emit(warden::testing::make_account(1), make_event("second"));
  work.restore(std::move(point));

  auto a = key("a");
  auto b = key("b");
  EXPECT_EQ(work.read(bytes_view_t{a.data(), a.size()}), bytes_t{1});
  EXPECT_FALSE(work.read(bytes_view_t{b.data(), b.size()}).has_value());
  ASSERT_EQ(work.events().size(), 1u);
  EXPECT_EQ(work.events().front().event.type, "first");
}

TEST_F(unit_of_work_test, discard_drops_everything) {
  auto work = unit_of_work{storage_};
  work.write(key("a"), bytes_t{1});
  work.emit(warden::testing::make_account(1), make_event("first"));
  work.discard();
  EXPECT_TRUE(work.empty());
  work.commit();
  EXPECT_FALSE(stored("a").has_value());
}

TEST_F(unit_of_work_test, typed_values_round_trip_through_commit) {
  auto work = unit_of_work{storage_};
  work.put(key("n"), uint64_t{42});
  work.commit();

  auto reader = unit_of_work{storage_};
  EXPECT_EQ(reader.get<uint64_t>(key("n")), uint64_t{42});
  EXPECT_FALSE(reader.get<uint64_t>(key("missing")).has_value());
}

TEST_F(unit_of_work_test, list_by_prefix_returns_matching_keys_only) {
  auto work = unit_of_work{storage_};
  work.write(key("P|1"), bytes_t{1});
  work.write(key("P|2"), bytes_t{2});
  work.write(key("Q|1"), bytes_t{3});
  work.commit();

  auto prefix = key("P|");
  auto entries =
      storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()});
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].second, bytes_t{1});
  EXPECT_EQ(entries[1].second, bytes_t{2});
}

TEST_F(unit_of_work_test, committed_state_persists) {
  EXPECT_FALSE(storage_.load_committed_state().has_value());
  storage_.save_committed_state(warden::storage::committed_state{
      .height = 9, .state_root = warden::testing::make_hash(4)});
  auto state = storage_.load_committed_state();
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->height, 9);
  EXPECT_EQ(state->state_root, warden::testing::make_hash(4));
}
