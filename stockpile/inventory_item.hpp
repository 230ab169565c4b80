// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/decimal.hpp"
#include "stockpile/stock_batch.hpp"
#include "stockpile/stock_lock.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/timestamp.hpp>
#include <caf/uuid.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stockpile {

/// Identifies the single inventory item of a product in a warehouse.
struct item_key {
  caf::uuid tenant_id;
  caf::uuid warehouse_id;
  caf::uuid product_id;
};

template <class Inspector>
bool inspect(Inspector& f, item_key& x) {
  return f.object(x).fields(f.field("tenant-id", x.tenant_id),
                            f.field("warehouse-id", x.warehouse_id),
                            f.field("product-id", x.product_id));
}

/// Persisted state of an inventory item, i.e., one row of `inventory_items`.
struct inventory_row {
  caf::uuid id;
  item_key key;
  quantity available;
  quantity locked;
  decimal unit_cost;
  quantity min_quantity;
  quantity max_quantity;
  int64_t version = 0;
  caf::timestamp created_at;
  caf::timestamp updated_at;
};

/// Aggregate root for the stock of one product in one warehouse. Tracks the
/// available and the locked quantity and issues stock locks. Every
/// successful mutation increments the version by one; failed operations
/// leave the item untouched.
class inventory_item {
public:
  inventory_item() = default;

  /// Creates an empty item at version 1.
  /// @returns `ec::invalid_argument` if `key` has no warehouse or product ID.
  static caf::expected<inventory_item> make(const item_key& key);

  /// Restores an item from its persisted state, without any locks.
  static inventory_item from_row(inventory_row row);

  const inventory_row& row() const noexcept {
    return row_;
  }

  const caf::uuid& id() const noexcept {
    return row_.id;
  }

  const item_key& key() const noexcept {
    return row_.key;
  }

  quantity available() const noexcept {
    return row_.available;
  }

  quantity locked() const noexcept {
    return row_.locked;
  }

  decimal unit_cost() const noexcept {
    return row_.unit_cost;
  }

  quantity min_quantity() const noexcept {
    return row_.min_quantity;
  }

  quantity max_quantity() const noexcept {
    return row_.max_quantity;
  }

  int64_t version() const noexcept {
    return row_.version;
  }

  /// Returns the authoritative on-hand quantity (available plus locked).
  decimal total_quantity() const noexcept {
    return row_.available.value() + row_.locked.value();
  }

  /// Returns the value of the on-hand quantity at the current unit cost.
  /// @returns `ec::invalid_argument` if the value overflows.
  caf::expected<decimal> total_value() const {
    return total_quantity().mul(row_.unit_cost);
  }

  bool can_fulfill(quantity amount) const noexcept {
    return amount <= row_.available;
  }

  bool is_below_minimum() const noexcept;

  bool is_above_maximum() const noexcept;

  /// Returns the batches received through this instance.
  const std::vector<stock_batch>& batches() const noexcept {
    return batches_;
  }

  /// Returns all locks known to this item, active or not.
  const std::vector<stock_lock>& locks() const noexcept {
    return locks_;
  }

  /// Looks up a known lock.
  /// @returns `nullptr` if this item has no lock with that ID.
  const stock_lock* find_lock(const caf::uuid& lock_id) const noexcept;

  std::vector<stock_lock> active_locks() const;

  /// Adds a persisted lock to the locks known to this item. Does not change
  /// any quantity or the version.
  /// @returns `ec::invalid_argument` if the lock belongs to another item or
  ///          if the item already knows a lock with the same ID.
  caf::error attach_lock(stock_lock lock);

  /// Moves `amount` from available to locked and issues a new active lock.
  caf::expected<stock_lock> lock_stock(quantity amount,
                                       std::string source_type,
                                       std::string source_id,
                                       caf::timestamp expire_at);

  /// Moves the quantity of an active lock back to available and marks the
  /// lock as released.
  caf::error unlock_stock(const caf::uuid& lock_id);

  /// Removes the quantity of an active lock from the item (shipment) and
  /// marks the lock as consumed.
  caf::error deduct_stock(const caf::uuid& lock_id);

  /// Adds `amount` to the available quantity and updates the moving
  /// weighted average unit cost. Records a new batch if `batch` is set.
  /// @returns `ec::invalid_argument` if the new cost is not representable.
  caf::error increase_stock(quantity amount, decimal incoming_unit_cost,
                            std::string_view note,
                            const std::optional<batch_info>& batch
                            = std::nullopt);

  /// Removes `amount` from the available quantity without a prior lock,
  /// e.g., for goods returned to a supplier.
  caf::error decrease_stock(quantity amount, std::string_view source_type,
                            std::string_view source_id,
                            std::string_view reason);

  /// Sets the available quantity to the result of a physical count.
  /// @returns `ec::has_locked_stock` while any stock is locked.
  caf::error adjust_stock(quantity actual, std::string_view reason);

  /// Sets the replenishment thresholds. A zero threshold disables it.
  caf::error set_thresholds(quantity min_qty, quantity max_qty);

  /// Returns all active locks with an expiry before `now`.
  std::vector<stock_lock> get_expired_locks(caf::timestamp now) const;

  /// Releases all locks returned by `get_expired_locks(now)`. Increments the
  /// version once per call if at least one lock was released.
  /// @returns the number of released locks.
  size_t release_expired_locks(caf::timestamp now);

  template <class Inspector>
  friend bool inspect(Inspector& f, inventory_item& x) {
    auto& r = x.row_;
    return f.object(x).fields(f.field("id", r.id), f.field("key", r.key),
                              f.field("available", r.available),
                              f.field("locked", r.locked),
                              f.field("unit-cost", r.unit_cost),
                              f.field("min-quantity", r.min_quantity),
                              f.field("max-quantity", r.max_quantity),
                              f.field("version", r.version),
                              f.field("created-at", r.created_at),
                              f.field("updated-at", r.updated_at),
                              f.field("locks", x.locks_));
  }

private:
  stock_lock* lookup_lock(const caf::uuid& lock_id);

  caf::error release_lock(stock_lock& lock, caf::timestamp now);

  void touch(caf::timestamp now);

  inventory_row row_;
  std::vector<stock_lock> locks_;
  std::vector<stock_batch> batches_;
};

} // namespace stockpile
