// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/stock_batch_store.hpp"

#include "stockpile/ec.hpp"

#include <sqlite3.h>

namespace stockpile {

namespace {

#define BATCH_COLUMNS                                                          \
  "id, inventory_item_id, batch_number, production_date, expiry_date, "        \
  "quantity, unit_cost, consumed, created_at"

constexpr std::string_view upsert_sql
  = "INSERT INTO stock_batches (" BATCH_COLUMNS ") "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (id) DO UPDATE SET consumed = excluded.consumed";

constexpr std::string_view select_by_item_sql
  = "SELECT " BATCH_COLUMNS " FROM stock_batches "
    "WHERE inventory_item_id = ? ORDER BY rowid";

#undef BATCH_COLUMNS

caf::expected<stock_batch> read_batch(const statement& stmt) {
  stock_batch result;
  result.id = stmt.column_uuid(0);
  result.inventory_item_id = stmt.column_uuid(1);
  result.batch_number = stmt.column_text(2);
  result.production_date = stmt.column_optional_timestamp(3);
  result.expiry_date = stmt.column_optional_timestamp(4);
  auto amount = stmt.column_quantity(5);
  if (!amount)
    return caf::make_error(ec::database_inaccessible,
                           "negative quantity in batch "
                             + to_string(result.id));
  result.amount = *amount;
  result.unit_cost = stmt.column_decimal(6);
  result.consumed = stmt.column_int64(7) != 0;
  result.created_at = stmt.column_timestamp(8);
  return result;
}

} // namespace

caf::error stock_batch_store::save(const stock_batch& batch) {
  auto consumed = int64_t{batch.consumed ? 1 : 0};
  auto stmt = db_->prepare(upsert_sql, batch.id, batch.inventory_item_id,
                           batch.batch_number, batch.production_date,
                           batch.expiry_date, batch.amount, batch.unit_cost,
                           consumed, batch.created_at);
  if (!stmt)
    return std::move(stmt.error());
  if (auto res = stmt->step(); res != SQLITE_DONE)
    return db_->make_error(res, "save batch");
  return caf::error{};
}

caf::expected<std::vector<stock_batch>>
stock_batch_store::find_by_item(const caf::uuid& inventory_item_id) {
  auto stmt = db_->prepare(select_by_item_sql, inventory_item_id);
  if (!stmt)
    return std::move(stmt.error());
  std::vector<stock_batch> result;
  auto res = stmt->step();
  for (; res == SQLITE_ROW; res = stmt->step()) {
    auto batch = read_batch(*stmt);
    if (!batch)
      return std::move(batch.error());
    result.push_back(std::move(*batch));
  }
  if (res != SQLITE_DONE)
    return db_->make_error(res, "find batches");
  return result;
}

} // namespace stockpile
