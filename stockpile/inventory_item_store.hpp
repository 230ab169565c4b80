// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/database.hpp"
#include "stockpile/decimal.hpp"
#include "stockpile/inventory_item.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/uuid.hpp>

#include <optional>
#include <vector>

namespace stockpile {

/// Persists inventory items in the `inventory_items` table. The store never
/// loads or saves locks; see `stock_lock_store` for those.
class inventory_item_store {
public:
  explicit inventory_item_store(database& db) : db_(&db) {
    // nop
  }

  /// @returns `ec::no_such_item` if no item has this ID.
  caf::expected<inventory_item> find_by_id(const caf::uuid& id);

  /// @returns `ec::no_such_item` if no item exists for `key`.
  caf::expected<inventory_item>
  find_by_warehouse_and_product(const item_key& key);

  /// Returns the item for `key`, creating an empty one if necessary.
  /// Concurrent callers for the same key all receive the same row: the
  /// insert does nothing on a conflict with the unique key index and the
  /// loser re-reads the row of the winner.
  caf::expected<inventory_item> get_or_create(const item_key& key);

  /// Inserts or overwrites the row of `item` without any version check.
  caf::error save(const inventory_item& item);

  /// Writes `item` if the stored row still has the version the item had
  /// before its last mutation, i.e., `item.version() - 1`.
  /// @returns `ec::optimistic_lock_conflict` if the row is missing or if
  ///          another writer advanced its version. The store never retries.
  caf::error save_with_lock(const inventory_item& item);

  /// Returns all items of a warehouse.
  caf::expected<std::vector<inventory_item>>
  find_by_warehouse(const caf::uuid& tenant_id, const caf::uuid& warehouse_id);

  /// Returns all items with an enabled minimum above their total quantity,
  /// optionally restricted to one warehouse.
  caf::expected<std::vector<inventory_item>>
  find_below_minimum(const caf::uuid& tenant_id,
                     const std::optional<caf::uuid>& warehouse_id);

  /// Sums the total quantity of a product across all warehouses.
  caf::expected<decimal> sum_quantity_by_product(const caf::uuid& tenant_id,
                                                 const caf::uuid& product_id);

  /// Sums the stock value (total quantity times unit cost) of a warehouse.
  caf::expected<decimal> sum_value_by_warehouse(const caf::uuid& tenant_id,
                                                const caf::uuid& warehouse_id);

private:
  caf::expected<inventory_item> fetch_one(statement& stmt);

  caf::expected<std::vector<inventory_item>> fetch_all(statement& stmt);

  caf::error insert_if_absent(const inventory_item& item);

  database* db_;
};

} // namespace stockpile
