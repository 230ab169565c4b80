// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/inventory_item_store.hpp"

#include "stockpile/ec.hpp"
#include "stockpile/log.hpp"

#include <sqlite3.h>

namespace stockpile {

namespace {

#define ITEM_COLUMNS                                                           \
  "id, tenant_id, warehouse_id, product_id, available_quantity, "              \
  "locked_quantity, unit_cost, min_quantity, max_quantity, version, "          \
  "created_at, updated_at"

constexpr std::string_view select_by_id_sql
  = "SELECT " ITEM_COLUMNS " FROM inventory_items WHERE id = ?";

constexpr std::string_view select_by_key_sql
  = "SELECT " ITEM_COLUMNS " FROM inventory_items "
    "WHERE tenant_id = ? AND warehouse_id = ? AND product_id = ?";

constexpr std::string_view select_by_warehouse_sql
  = "SELECT " ITEM_COLUMNS " FROM inventory_items "
    "WHERE tenant_id = ? AND warehouse_id = ? ORDER BY product_id";

constexpr std::string_view select_below_minimum_sql
  = "SELECT " ITEM_COLUMNS " FROM inventory_items "
    "WHERE tenant_id = ?1 AND (?2 IS NULL OR warehouse_id = ?2) "
    "AND min_quantity > 0 "
    "AND (available_quantity + locked_quantity) < min_quantity "
    "ORDER BY warehouse_id, product_id";

constexpr std::string_view insert_if_absent_sql
  = "INSERT INTO inventory_items (" ITEM_COLUMNS ") "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (tenant_id, warehouse_id, product_id) DO NOTHING";

constexpr std::string_view upsert_sql
  = "INSERT INTO inventory_items (" ITEM_COLUMNS ") "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (id) DO UPDATE SET "
    "available_quantity = excluded.available_quantity, "
    "locked_quantity = excluded.locked_quantity, "
    "unit_cost = excluded.unit_cost, "
    "min_quantity = excluded.min_quantity, "
    "max_quantity = excluded.max_quantity, "
    "version = excluded.version, "
    "updated_at = excluded.updated_at";

constexpr std::string_view compare_and_swap_sql
  = "UPDATE inventory_items SET available_quantity = ?, locked_quantity = ?, "
    "unit_cost = ?, min_quantity = ?, max_quantity = ?, version = ?, "
    "updated_at = ? WHERE id = ? AND version = ?";

constexpr std::string_view sum_quantity_sql
  = "SELECT COALESCE(SUM(available_quantity + locked_quantity), 0) "
    "FROM inventory_items WHERE tenant_id = ? AND product_id = ?";

#undef ITEM_COLUMNS

caf::expected<inventory_row> read_row(const statement& stmt) {
  inventory_row row;
  row.id = stmt.column_uuid(0);
  row.key.tenant_id = stmt.column_uuid(1);
  row.key.warehouse_id = stmt.column_uuid(2);
  row.key.product_id = stmt.column_uuid(3);
  auto available = stmt.column_quantity(4);
  auto locked = stmt.column_quantity(5);
  auto min_qty = stmt.column_quantity(7);
  auto max_qty = stmt.column_quantity(8);
  if (!available || !locked || !min_qty || !max_qty)
    return caf::make_error(ec::database_inaccessible,
                           "negative quantity in row " + to_string(row.id));
  row.available = *available;
  row.locked = *locked;
  row.unit_cost = stmt.column_decimal(6);
  row.min_quantity = *min_qty;
  row.max_quantity = *max_qty;
  row.version = stmt.column_int64(9);
  row.created_at = stmt.column_timestamp(10);
  row.updated_at = stmt.column_timestamp(11);
  return row;
}

} // namespace

caf::expected<inventory_item>
inventory_item_store::find_by_id(const caf::uuid& id) {
  auto stmt = db_->prepare(select_by_id_sql, id);
  if (!stmt)
    return std::move(stmt.error());
  return fetch_one(*stmt);
}

caf::expected<inventory_item>
inventory_item_store::find_by_warehouse_and_product(const item_key& key) {
  auto stmt = db_->prepare(select_by_key_sql, key.tenant_id, key.warehouse_id,
                           key.product_id);
  if (!stmt)
    return std::move(stmt.error());
  return fetch_one(*stmt);
}

caf::expected<inventory_item>
inventory_item_store::get_or_create(const item_key& key) {
  if (auto found = find_by_warehouse_and_product(key);
      found || found.error() != ec::no_such_item)
    return found;
  auto item = inventory_item::make(key);
  if (!item)
    return item;
  if (auto err = insert_if_absent(*item))
    return err;
  if (db_->changes() == 0) {
    // Another connection created the item between our read and our insert.
    log::debug("lost the race for creating item {}/{}",
               to_string(key.warehouse_id), to_string(key.product_id));
    return find_by_warehouse_and_product(key);
  }
  log::debug("created item {}", to_string(item->id()));
  return item;
}

caf::error inventory_item_store::save(const inventory_item& item) {
  const auto& r = item.row();
  auto stmt = db_->prepare(upsert_sql, r.id, r.key.tenant_id,
                           r.key.warehouse_id, r.key.product_id, r.available,
                           r.locked, r.unit_cost, r.min_quantity,
                           r.max_quantity, r.version, r.created_at,
                           r.updated_at);
  if (!stmt)
    return std::move(stmt.error());
  if (auto res = stmt->step(); res != SQLITE_DONE)
    return db_->make_error(res, "save item");
  return caf::error{};
}

caf::error inventory_item_store::save_with_lock(const inventory_item& item) {
  const auto& r = item.row();
  auto base_version = r.version - 1;
  auto stmt = db_->prepare(compare_and_swap_sql, r.available, r.locked,
                           r.unit_cost, r.min_quantity, r.max_quantity,
                           r.version, r.updated_at, r.id, base_version);
  if (!stmt)
    return std::move(stmt.error());
  if (auto res = stmt->step(); res != SQLITE_DONE)
    return db_->make_error(res, "save item");
  if (db_->changes() == 0) {
    log::warning("optimistic lock conflict on item {} at version {}",
                 to_string(r.id), base_version);
    return caf::make_error(ec::optimistic_lock_conflict,
                           "item " + to_string(r.id)
                             + " no longer has version "
                             + std::to_string(base_version));
  }
  return caf::error{};
}

caf::expected<std::vector<inventory_item>>
inventory_item_store::find_by_warehouse(const caf::uuid& tenant_id,
                                        const caf::uuid& warehouse_id) {
  auto stmt = db_->prepare(select_by_warehouse_sql, tenant_id, warehouse_id);
  if (!stmt)
    return std::move(stmt.error());
  return fetch_all(*stmt);
}

caf::expected<std::vector<inventory_item>>
inventory_item_store::find_below_minimum(
  const caf::uuid& tenant_id, const std::optional<caf::uuid>& warehouse_id) {
  auto stmt = db_->prepare(select_below_minimum_sql, tenant_id, warehouse_id);
  if (!stmt)
    return std::move(stmt.error());
  return fetch_all(*stmt);
}

caf::expected<decimal>
inventory_item_store::sum_quantity_by_product(const caf::uuid& tenant_id,
                                              const caf::uuid& product_id) {
  auto stmt = db_->prepare(sum_quantity_sql, tenant_id, product_id);
  if (!stmt)
    return std::move(stmt.error());
  if (auto res = stmt->step(); res != SQLITE_ROW)
    return db_->make_error(res, "sum quantity");
  return stmt->column_decimal(0);
}

caf::expected<decimal>
inventory_item_store::sum_value_by_warehouse(const caf::uuid& tenant_id,
                                             const caf::uuid& warehouse_id) {
  // Multiply in C++ to round each item the same way as total_value().
  auto items = find_by_warehouse(tenant_id, warehouse_id);
  if (!items)
    return std::move(items.error());
  auto result = decimal{};
  for (const auto& item : *items) {
    auto value = item.total_value();
    if (!value)
      return std::move(value.error());
    auto sum = result.add(*value);
    if (!sum)
      return std::move(sum.error());
    result = *sum;
  }
  return result;
}

caf::expected<inventory_item> inventory_item_store::fetch_one(statement& stmt) {
  switch (auto res = stmt.step()) {
    case SQLITE_ROW: {
      auto row = read_row(stmt);
      if (!row)
        return std::move(row.error());
      return inventory_item::from_row(std::move(*row));
    }
    case SQLITE_DONE:
      return caf::make_error(ec::no_such_item);
    default:
      return db_->make_error(res, "find item");
  }
}

caf::expected<std::vector<inventory_item>>
inventory_item_store::fetch_all(statement& stmt) {
  std::vector<inventory_item> result;
  auto res = stmt.step();
  for (; res == SQLITE_ROW; res = stmt.step()) {
    auto row = read_row(stmt);
    if (!row)
      return std::move(row.error());
    result.push_back(inventory_item::from_row(std::move(*row)));
  }
  if (res != SQLITE_DONE)
    return db_->make_error(res, "find items");
  return result;
}

caf::error inventory_item_store::insert_if_absent(const inventory_item& item) {
  const auto& r = item.row();
  auto stmt = db_->prepare(insert_if_absent_sql, r.id, r.key.tenant_id,
                           r.key.warehouse_id, r.key.product_id, r.available,
                           r.locked, r.unit_cost, r.min_quantity,
                           r.max_quantity, r.version, r.created_at,
                           r.updated_at);
  if (!stmt)
    return std::move(stmt.error());
  if (auto res = stmt->step(); res != SQLITE_DONE)
    return db_->make_error(res, "create item");
  return caf::error{};
}

} // namespace stockpile
