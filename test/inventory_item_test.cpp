// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/inventory_item.hpp"

#include "stockpile/ec.hpp"
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

class InventoryItemTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto maybe_item = inventory_item::make(make_key());
    ASSERT_TRUE(maybe_item);
    item = std::move(*maybe_item);
  }

  // Brings the item to the given available quantity at version 1.
  void stock(int64_t amount) {
    auto row = item.row();
    row.available = qty(amount);
    item = inventory_item::from_row(row);
  }

  stock_lock lock(int64_t amount, const std::string& source_id) {
    auto result = item.lock_stock(qty(amount), "order", source_id,
                                  caf::make_timestamp() + 1h);
    EXPECT_TRUE(result);
    return result ? *result : stock_lock{};
  }

  void expect_invariants() {
    EXPECT_FALSE(item.available().value().is_negative());
    EXPECT_FALSE(item.locked().value().is_negative());
    EXPECT_EQ(item.total_quantity(),
              item.available().value() + item.locked().value());
  }

  inventory_item item;
};

} // namespace

TEST(InventoryItemMakeTest, StartsEmptyAtVersionOne) {
  auto item = inventory_item::make(make_key());
  ASSERT_TRUE(item);
  EXPECT_FALSE(item->id().is_nil());
  EXPECT_EQ(item->version(), 1);
  EXPECT_TRUE(item->available().is_zero());
  EXPECT_TRUE(item->locked().is_zero());
  EXPECT_TRUE(item->locks().empty());
}

TEST(InventoryItemMakeTest, RequiresWarehouseAndProduct) {
  auto key = make_key();
  key.warehouse_id = caf::uuid{};
  auto item = inventory_item::make(key);
  ASSERT_FALSE(item);
  EXPECT_EQ(item.error(), ec::invalid_argument);
  key = make_key();
  key.product_id = caf::uuid{};
  EXPECT_FALSE(inventory_item::make(key));
}

TEST_F(InventoryItemTest, LockMovesQuantityFromAvailableToLocked) {
  // Given an item with 100 available
  stock(100);
  // When locking 30
  auto lk = lock(30, "O-1");
  // Then 30 move to locked and the total stays the same
  EXPECT_EQ(item.available(), qty(70));
  EXPECT_EQ(item.locked(), qty(30));
  EXPECT_EQ(item.total_quantity(), dec("100"));
  EXPECT_EQ(item.version(), 2);
  EXPECT_TRUE(lk.is_active());
  EXPECT_EQ(lk.inventory_item_id, item.id());
  EXPECT_EQ(lk.amount, qty(30));
  EXPECT_EQ(lk.source_type, "order");
  EXPECT_EQ(lk.source_id, "O-1");
  expect_invariants();
}

TEST_F(InventoryItemTest, LockThenUnlockRestoresQuantities) {
  // Given an item with 40 available
  stock(40);
  // When locking and then unlocking 15
  auto lk = lock(15, "O-1");
  ASSERT_FALSE(item.unlock_stock(lk.id));
  // Then the quantities are back to their original values
  EXPECT_EQ(item.available(), qty(40));
  EXPECT_TRUE(item.locked().is_zero());
  EXPECT_EQ(item.total_quantity(), dec("40"));
  EXPECT_EQ(item.version(), 3);
  ASSERT_NE(item.find_lock(lk.id), nullptr);
  EXPECT_EQ(item.find_lock(lk.id)->state, lock_state::released);
  EXPECT_TRUE(item.find_lock(lk.id)->released_at.has_value());
  expect_invariants();
}

TEST_F(InventoryItemTest, DeductRemovesLockedQuantityFromTotal) {
  // Given an item with 40 available and a lock of 15
  stock(40);
  auto lk = lock(15, "O-1");
  // When deducting the lock
  ASSERT_FALSE(item.deduct_stock(lk.id));
  // Then the total drops by 15 and available stays at its post-lock value
  EXPECT_EQ(item.available(), qty(25));
  EXPECT_TRUE(item.locked().is_zero());
  EXPECT_EQ(item.total_quantity(), dec("25"));
  EXPECT_EQ(item.find_lock(lk.id)->state, lock_state::consumed);
  expect_invariants();
}

TEST_F(InventoryItemTest, LockingMoreThanAvailableFails) {
  // Given an item with 50 available
  stock(50);
  // When locking 51
  auto result = item.lock_stock(qty(51), "order", "O-1",
                                caf::make_timestamp() + 1h);
  // Then the lock fails and nothing changes
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), ec::insufficient_stock);
  EXPECT_EQ(item.available(), qty(50));
  EXPECT_TRUE(item.locked().is_zero());
  EXPECT_EQ(item.version(), 1);
  EXPECT_TRUE(item.locks().empty());
  // When locking exactly 50
  lock(50, "O-2");
  // Then a further lock of 1 fails
  auto one_more = item.lock_stock(qty(1), "order", "O-3",
                                  caf::make_timestamp() + 1h);
  ASSERT_FALSE(one_more);
  EXPECT_EQ(one_more.error(), ec::insufficient_stock);
  EXPECT_EQ(item.version(), 2);
}

TEST_F(InventoryItemTest, LockRejectsInvalidArguments) {
  stock(10);
  auto exp = caf::make_timestamp() + 1h;
  EXPECT_EQ(item.lock_stock(quantity{}, "order", "O-1", exp).error(),
            ec::invalid_argument);
  EXPECT_EQ(item.lock_stock(qty(1), "", "O-1", exp).error(),
            ec::invalid_argument);
  EXPECT_EQ(item.lock_stock(qty(1), "order", "", exp).error(),
            ec::invalid_argument);
  EXPECT_EQ(item.version(), 1);
  EXPECT_EQ(item.available(), qty(10));
}

TEST_F(InventoryItemTest, CanFulfillComparesWithAvailable) {
  stock(10);
  EXPECT_TRUE(item.can_fulfill(qty(10)));
  EXPECT_FALSE(item.can_fulfill(qty("10.0001")));
  lock(4, "O-1");
  EXPECT_FALSE(item.can_fulfill(qty(7)));
  EXPECT_EQ(item.version(), 2);
}

TEST_F(InventoryItemTest, UnlockAfterDeductFails) {
  stock(10);
  auto lk = lock(5, "O-1");
  ASSERT_FALSE(item.deduct_stock(lk.id));
  auto version = item.version();
  EXPECT_EQ(item.unlock_stock(lk.id), ec::invalid_lock_state);
  EXPECT_EQ(item.deduct_stock(lk.id), ec::invalid_lock_state);
  EXPECT_EQ(item.version(), version);
  EXPECT_EQ(item.available(), qty(5));
}

TEST_F(InventoryItemTest, DeductAfterUnlockFails) {
  stock(10);
  auto lk = lock(5, "O-1");
  ASSERT_FALSE(item.unlock_stock(lk.id));
  auto version = item.version();
  EXPECT_EQ(item.deduct_stock(lk.id), ec::invalid_lock_state);
  EXPECT_EQ(item.unlock_stock(lk.id), ec::invalid_lock_state);
  EXPECT_EQ(item.version(), version);
  EXPECT_EQ(item.available(), qty(10));
  EXPECT_EQ(item.find_lock(lk.id)->state, lock_state::released);
}

TEST_F(InventoryItemTest, UnknownLocksAreReported) {
  stock(10);
  EXPECT_EQ(item.unlock_stock(caf::uuid::random()), ec::no_such_lock);
  EXPECT_EQ(item.deduct_stock(caf::uuid::random()), ec::no_such_lock);
  EXPECT_EQ(item.version(), 1);
}

TEST_F(InventoryItemTest, IncreaseComputesWeightedAverageCost) {
  // Given an empty item
  // When receiving 10 at 2.00
  ASSERT_FALSE(item.increase_stock(qty(10), dec("2"), "PO-1"));
  // Then the unit cost is the incoming cost
  EXPECT_EQ(item.unit_cost(), dec("2"));
  EXPECT_EQ(item.available(), qty(10));
  // When receiving 20 at 3.50
  ASSERT_FALSE(item.increase_stock(qty(20), dec("3.5"), "PO-2"));
  // Then the unit cost is (10 * 2 + 20 * 3.5) / 30 = 3
  EXPECT_EQ(item.unit_cost(), dec("3"));
  EXPECT_EQ(item.available(), qty(30));
  // When receiving 1 at 1
  ASSERT_FALSE(item.increase_stock(qty(1), dec("1"), "PO-3"));
  // Then the unit cost is 91 / 31, rounded to four digits
  EXPECT_EQ(item.unit_cost(), dec("2.9355"));
  EXPECT_EQ(item.version(), 4);
  auto value = item.total_value();
  ASSERT_TRUE(value);
  EXPECT_EQ(*value, dec("91.0005"));
}

TEST_F(InventoryItemTest, IncreaseIncludesLockedStockInAverage) {
  stock(10);
  ASSERT_FALSE(item.increase_stock(qty(10), dec("4"), "PO-1"));
  lock(15, "O-1");
  // 20 on hand at 2, where 15 are locked.
  ASSERT_FALSE(item.increase_stock(qty(20), dec("5"), "PO-2"));
  EXPECT_EQ(item.unit_cost(), dec("3.5"));
  EXPECT_EQ(item.available(), qty(25));
  EXPECT_EQ(item.locked(), qty(15));
}

TEST_F(InventoryItemTest, IncreaseRejectsInvalidArguments) {
  EXPECT_EQ(item.increase_stock(quantity{}, dec("1"), ""),
            ec::invalid_argument);
  EXPECT_EQ(item.increase_stock(qty(1), dec("-1"), ""), ec::invalid_argument);
  EXPECT_EQ(item.version(), 1);
  EXPECT_TRUE(item.available().is_zero());
}

TEST_F(InventoryItemTest, IncreaseFailsWhenTheAverageCostOverflows) {
  // Given 10 million units on hand at a unit cost of one billion
  auto row = item.row();
  row.available = qty(10'000'000);
  row.unit_cost = dec("1000000000");
  item = inventory_item::from_row(row);
  EXPECT_EQ(item.total_value().error(), ec::invalid_argument);
  // When receiving one more unit
  auto err = item.increase_stock(qty(1), dec("1"), "PO-1");
  // Then the increase fails and leaves the item untouched
  EXPECT_EQ(err, ec::invalid_argument);
  EXPECT_EQ(item.available(), qty(10'000'000));
  EXPECT_EQ(item.unit_cost(), dec("1000000000"));
  EXPECT_EQ(item.version(), 1);
}

TEST_F(InventoryItemTest, IncreaseRecordsBatch) {
  auto expiry = caf::make_timestamp() + 24h * 90;
  auto batch = batch_info{"B-17", std::nullopt, expiry};
  ASSERT_FALSE(item.increase_stock(qty(8), dec("1.25"), "PO-1", batch));
  ASSERT_EQ(item.batches().size(), 1u);
  const auto& received = item.batches().front();
  EXPECT_FALSE(received.id.is_nil());
  EXPECT_EQ(received.inventory_item_id, item.id());
  EXPECT_EQ(received.batch_number, "B-17");
  EXPECT_FALSE(received.production_date);
  ASSERT_TRUE(received.expiry_date);
  EXPECT_EQ(*received.expiry_date, expiry);
  EXPECT_EQ(received.amount, qty(8));
  EXPECT_EQ(received.unit_cost, dec("1.25"));
  EXPECT_FALSE(received.consumed);
  EXPECT_EQ(item.version(), 2);
}

TEST_F(InventoryItemTest, IncreaseRequiresBatchNumber) {
  auto batch = batch_info{};
  EXPECT_EQ(item.increase_stock(qty(8), dec("1"), "PO-1", batch),
            ec::invalid_argument);
  EXPECT_TRUE(item.batches().empty());
  EXPECT_TRUE(item.available().is_zero());
  EXPECT_EQ(item.version(), 1);
}

TEST_F(InventoryItemTest, DecreaseRemovesAvailableStock) {
  // Given 25 available and 5 locked
  stock(30);
  lock(5, "O-1");
  // When returning 10 to the supplier
  ASSERT_FALSE(item.decrease_stock(qty(10), "purchase_return", "PR-1",
                                   "damaged"));
  // Then only the available quantity shrinks
  EXPECT_EQ(item.available(), qty(15));
  EXPECT_EQ(item.locked(), qty(5));
  EXPECT_EQ(item.version(), 3);
  expect_invariants();
}

TEST_F(InventoryItemTest, DecreaseRejectsInvalidRequests) {
  stock(10);
  lock(4, "O-1");
  // Locked stock cannot be decreased directly.
  EXPECT_EQ(item.decrease_stock(qty(7), "purchase_return", "PR-1", ""),
            ec::insufficient_stock);
  EXPECT_EQ(item.decrease_stock(quantity{}, "purchase_return", "PR-1", ""),
            ec::invalid_argument);
  EXPECT_EQ(item.decrease_stock(qty(1), "", "PR-1", ""), ec::invalid_argument);
  EXPECT_EQ(item.decrease_stock(qty(1), "purchase_return", "", ""),
            ec::invalid_argument);
  EXPECT_EQ(item.available(), qty(6));
  EXPECT_EQ(item.version(), 2);
  // Decreasing everything available is fine.
  ASSERT_FALSE(item.decrease_stock(qty(6), "purchase_return", "PR-1", ""));
  EXPECT_TRUE(item.available().is_zero());
  expect_invariants();
}

TEST_F(InventoryItemTest, AdjustIsRefusedWhileStockIsLocked) {
  // Given 20 available and 5 locked
  stock(25);
  auto o1 = lock(5, "O-1");
  // When a physical count finds 12 available
  auto err = item.adjust_stock(qty(12), "cycle count");
  // Then the adjustment is refused
  EXPECT_EQ(err, ec::has_locked_stock);
  EXPECT_EQ(item.available(), qty(20));
  EXPECT_EQ(item.locked(), qty(5));
  EXPECT_EQ(item.version(), 2);
  // And succeeds once the lock is gone
  ASSERT_FALSE(item.unlock_stock(o1.id));
  ASSERT_FALSE(item.adjust_stock(qty(12), "cycle count"));
  EXPECT_EQ(item.available(), qty(12));
  EXPECT_TRUE(item.locked().is_zero());
  EXPECT_EQ(item.version(), 4);
  expect_invariants();
}

TEST_F(InventoryItemTest, AdjustRequiresReason) {
  stock(5);
  EXPECT_EQ(item.adjust_stock(qty(3), ""), ec::invalid_argument);
  EXPECT_EQ(item.available(), qty(5));
  EXPECT_EQ(item.version(), 1);
}

TEST_F(InventoryItemTest, ThresholdsDriveReplenishmentChecks) {
  stock(5);
  ASSERT_FALSE(item.set_thresholds(qty(10), qty(100)));
  EXPECT_TRUE(item.is_below_minimum());
  EXPECT_FALSE(item.is_above_maximum());
  EXPECT_EQ(item.version(), 2);
  EXPECT_EQ(item.set_thresholds(qty(10), qty(5)), ec::invalid_argument);
  EXPECT_EQ(item.min_quantity(), qty(10));
  // A zero maximum disables the upper bound.
  ASSERT_FALSE(item.set_thresholds(qty(0), qty(0)));
  EXPECT_FALSE(item.is_below_minimum());
  EXPECT_FALSE(item.is_above_maximum());
}

TEST_F(InventoryItemTest, ReleasesOnlyExpiredLocks) {
  // Given one expired and one active lock
  stock(100);
  auto now = caf::make_timestamp();
  auto expired = item.lock_stock(qty(10), "order", "O-1", now - 1min);
  auto fresh = item.lock_stock(qty(20), "order", "O-2", now + 1h);
  ASSERT_TRUE(expired);
  ASSERT_TRUE(fresh);
  ASSERT_EQ(item.get_expired_locks(now).size(), 1u);
  auto version = item.version();
  // When releasing expired locks
  auto count = item.release_expired_locks(now);
  // Then only the expired lock is released and its quantity is available
  EXPECT_EQ(count, 1u);
  EXPECT_EQ(item.available(), qty(80));
  EXPECT_EQ(item.locked(), qty(20));
  EXPECT_EQ(item.find_lock(expired->id)->state, lock_state::released);
  EXPECT_EQ(item.find_lock(fresh->id)->state, lock_state::active);
  EXPECT_EQ(item.version(), version + 1);
  EXPECT_TRUE(item.get_expired_locks(now).empty());
  // A second sweep finds nothing and leaves the version alone.
  EXPECT_EQ(item.release_expired_locks(now), 0u);
  EXPECT_EQ(item.version(), version + 1);
}

TEST_F(InventoryItemTest, SweepBumpsVersionOncePerCall) {
  stock(30);
  auto past = caf::make_timestamp() - 1min;
  for (auto id : {"O-1", "O-2", "O-3"})
    ASSERT_TRUE(item.lock_stock(qty(10), "order", id, past));
  auto version = item.version();
  EXPECT_EQ(item.release_expired_locks(caf::make_timestamp()), 3u);
  EXPECT_EQ(item.version(), version + 1);
  EXPECT_EQ(item.available(), qty(30));
  EXPECT_TRUE(item.locked().is_zero());
}

TEST_F(InventoryItemTest, AttachOnlyAcceptsOwnLocks) {
  stock_lock foreign;
  foreign.id = caf::uuid::random();
  foreign.inventory_item_id = caf::uuid::random();
  foreign.amount = qty(1);
  EXPECT_EQ(item.attach_lock(foreign), ec::invalid_argument);
  foreign.inventory_item_id = item.id();
  EXPECT_FALSE(item.attach_lock(foreign));
  EXPECT_EQ(item.attach_lock(foreign), ec::invalid_argument);
  EXPECT_EQ(item.active_locks().size(), 1u);
  EXPECT_EQ(item.version(), 1);
}

TEST_F(InventoryItemTest, EndToEndScenario) {
  // Given 100 available at version 1
  stock(100);
  ASSERT_EQ(item.version(), 1);
  // Lock 30 for O-1
  auto o1 = lock(30, "O-1");
  EXPECT_EQ(item.available(), qty(70));
  EXPECT_EQ(item.locked(), qty(30));
  EXPECT_EQ(item.version(), 2);
  // Lock 20 for O-2
  auto o2 = lock(20, "O-2");
  EXPECT_EQ(item.available(), qty(50));
  EXPECT_EQ(item.locked(), qty(50));
  EXPECT_EQ(item.version(), 3);
  // Deduct O-1
  ASSERT_FALSE(item.deduct_stock(o1.id));
  EXPECT_EQ(item.available(), qty(50));
  EXPECT_EQ(item.locked(), qty(20));
  EXPECT_EQ(item.version(), 4);
  EXPECT_EQ(item.total_quantity(), dec("70"));
  // Unlock O-2
  ASSERT_FALSE(item.unlock_stock(o2.id));
  EXPECT_EQ(item.available(), qty(70));
  EXPECT_TRUE(item.locked().is_zero());
  EXPECT_EQ(item.version(), 5);
  EXPECT_EQ(item.total_quantity(), dec("70"));
  expect_invariants();
}
