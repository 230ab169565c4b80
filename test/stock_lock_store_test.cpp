// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/stock_lock_store.hpp"

#include "stockpile/ec.hpp"
#include "stockpile/inventory_item_store.hpp"
#include "fixture.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>

using namespace std::literals;
using namespace stockpile;
using stockpile::test::dec;
using stockpile::test::make_key;
using stockpile::test::qty;

namespace {

class StockLockStoreTest : public stockpile::test::database_fixture {
protected:
  void SetUp() override {
    database_fixture::SetUp();
    if (HasFatalFailure())
      return;
    items.emplace(*db);
    locks.emplace(*db);
    auto maybe_item = items->get_or_create(make_key());
    ASSERT_TRUE(maybe_item);
    item = std::move(*maybe_item);
    ASSERT_FALSE(item.increase_stock(qty(100), dec("1"), "PO-1"));
    ASSERT_FALSE(items->save_with_lock(item));
  }

  // Locks stock on the item and persists both.
  stock_lock lock(int64_t amount, const std::string& source_id,
                  caf::timestamp expire_at) {
    auto result = item.lock_stock(qty(amount), "order", source_id, expire_at);
    EXPECT_TRUE(result);
    if (!result)
      return stock_lock{};
    EXPECT_FALSE(items->save_with_lock(item));
    EXPECT_FALSE(locks->save(*result));
    return *result;
  }

  inventory_item reload() {
    auto result = items->find_by_id(item.id());
    EXPECT_TRUE(result);
    return result ? std::move(*result) : inventory_item{};
  }

  std::optional<inventory_item_store> items;
  std::optional<stock_lock_store> locks;
  inventory_item item;
};

} // namespace

TEST_F(StockLockStoreTest, SaveAndFindById) {
  auto deadline = caf::make_timestamp() + 1h;
  auto saved = lock(5, "O-1", deadline);
  auto found = locks->find_by_id(saved.id);
  ASSERT_TRUE(found);
  EXPECT_EQ(found->inventory_item_id, item.id());
  EXPECT_EQ(found->amount, qty(5));
  EXPECT_EQ(found->source_type, "order");
  EXPECT_EQ(found->source_id, "O-1");
  EXPECT_EQ(found->expire_at, deadline);
  EXPECT_EQ(found->state, lock_state::active);
  EXPECT_FALSE(found->released_at.has_value());
  EXPECT_EQ(locks->find_by_id(caf::uuid::random()).error(), ec::no_such_lock);
}

TEST_F(StockLockStoreTest, SavePersistsStateTransitions) {
  auto deadline = caf::make_timestamp() + 1h;
  auto first = lock(5, "O-1", deadline);
  auto second = lock(7, "O-2", deadline);
  ASSERT_FALSE(item.unlock_stock(first.id));
  ASSERT_FALSE(item.deduct_stock(second.id));
  ASSERT_FALSE(locks->save(*item.find_lock(first.id)));
  ASSERT_FALSE(locks->save(*item.find_lock(second.id)));
  auto released = locks->find_by_id(first.id);
  auto consumed = locks->find_by_id(second.id);
  ASSERT_TRUE(released);
  ASSERT_TRUE(consumed);
  EXPECT_EQ(released->state, lock_state::released);
  EXPECT_TRUE(released->released_at.has_value());
  EXPECT_EQ(consumed->state, lock_state::consumed);
}

TEST_F(StockLockStoreTest, FindActiveSkipsTerminalLocks) {
  auto deadline = caf::make_timestamp() + 1h;
  auto first = lock(5, "O-1", deadline);
  auto second = lock(7, "O-2", deadline);
  ASSERT_FALSE(item.unlock_stock(first.id));
  ASSERT_FALSE(locks->save(*item.find_lock(first.id)));
  auto active = locks->find_active(item.id());
  ASSERT_TRUE(active);
  ASSERT_EQ(active->size(), 1u);
  EXPECT_EQ(active->front().id, second.id);
  auto by_source = locks->find_by_source("order", "O-2");
  ASSERT_TRUE(by_source);
  ASSERT_EQ(by_source->size(), 1u);
  EXPECT_EQ(by_source->front().id, second.id);
  auto gone = locks->find_by_source("order", "O-1");
  ASSERT_TRUE(gone);
  EXPECT_TRUE(gone->empty());
}

TEST_F(StockLockStoreTest, ReleaseExpiredOnlyTouchesExpiredLocks) {
  // Given one expired and one active lock
  auto now = caf::make_timestamp();
  auto expired = lock(10, "O-1", now - 1min);
  auto fresh = lock(20, "O-2", now + 1h);
  auto before = reload();
  ASSERT_EQ(before.available(), qty(70));
  ASSERT_EQ(before.locked(), qty(30));
  auto expired_locks = locks->find_expired(now);
  ASSERT_TRUE(expired_locks);
  ASSERT_EQ(expired_locks->size(), 1u);
  // When sweeping
  auto count = locks->release_expired(now);
  // Then only the expired lock is released and its quantity is available
  ASSERT_TRUE(count);
  EXPECT_EQ(*count, 1u);
  auto swept = locks->find_by_id(expired.id);
  ASSERT_TRUE(swept);
  EXPECT_EQ(swept->state, lock_state::released);
  EXPECT_EQ(swept->released_at, std::optional<caf::timestamp>{now});
  auto kept = locks->find_by_id(fresh.id);
  ASSERT_TRUE(kept);
  EXPECT_EQ(kept->state, lock_state::active);
  auto after = reload();
  EXPECT_EQ(after.available(), qty(80));
  EXPECT_EQ(after.locked(), qty(20));
  EXPECT_EQ(after.version(), before.version() + 1);
  // A second sweep has nothing left to do
  auto again = locks->release_expired(now);
  ASSERT_TRUE(again);
  EXPECT_EQ(*again, 0u);
  EXPECT_EQ(reload().version(), after.version());
}

TEST_F(StockLockStoreTest, ReleaseExpiredBumpsEachItemOnce) {
  auto past = caf::make_timestamp() - 1min;
  lock(10, "O-1", past);
  lock(15, "O-2", past);
  auto before = reload();
  auto count = locks->release_expired(caf::make_timestamp());
  ASSERT_TRUE(count);
  EXPECT_EQ(*count, 2u);
  auto after = reload();
  EXPECT_EQ(after.available(), qty(100));
  EXPECT_TRUE(after.locked().is_zero());
  EXPECT_EQ(after.version(), before.version() + 1);
}

TEST_F(StockLockStoreTest, StaleCopyConflictsAfterSweep) {
  // Given an in-memory copy loaded before the sweep
  lock(10, "O-1", caf::make_timestamp() - 1min);
  auto stale = reload();
  ASSERT_TRUE(locks->release_expired(caf::make_timestamp()));
  // When the stale copy is mutated and saved
  ASSERT_TRUE(stale.lock_stock(qty(1), "order", "O-2",
                               caf::make_timestamp() + 1h));
  // Then the version check rejects it
  EXPECT_EQ(items->save_with_lock(stale), ec::optimistic_lock_conflict);
}
