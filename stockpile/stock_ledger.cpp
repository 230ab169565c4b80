// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/stock_ledger.hpp"

#include "stockpile/ec.hpp"

#include <sqlite3.h>

#include <iterator>

namespace stockpile {

namespace {

constexpr std::string_view movement_type_names[] = {
  "inbound",
  "outbound",
  "adjustment_increase",
  "adjustment_decrease",
  "lock",
  "unlock",
};

#define LEDGER_COLUMNS                                                         \
  "id, tenant_id, inventory_item_id, warehouse_id, product_id, "               \
  "transaction_type, quantity, unit_cost, balance_before, balance_after, "     \
  "source_type, source_id, lock_id, reason, created_at"

constexpr std::string_view insert_sql
  = "INSERT INTO inventory_transactions (" LEDGER_COLUMNS ") "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

// The rowid reflects the insertion order, even for equal timestamps.
constexpr std::string_view select_by_item_sql
  = "SELECT " LEDGER_COLUMNS " FROM inventory_transactions "
    "WHERE inventory_item_id = ? ORDER BY rowid";

constexpr std::string_view select_by_source_sql
  = "SELECT " LEDGER_COLUMNS " FROM inventory_transactions "
    "WHERE source_type = ? AND source_id = ? ORDER BY rowid";

#undef LEDGER_COLUMNS

caf::expected<ledger_entry> read_entry(const statement& stmt) {
  ledger_entry result;
  result.id = stmt.column_uuid(0);
  result.tenant_id = stmt.column_uuid(1);
  result.inventory_item_id = stmt.column_uuid(2);
  result.warehouse_id = stmt.column_uuid(3);
  result.product_id = stmt.column_uuid(4);
  if (!from_string(stmt.column_text(5), result.type))
    return caf::make_error(ec::database_inaccessible,
                           "unknown movement type in ledger entry "
                             + to_string(result.id));
  result.amount = stmt.column_decimal(6);
  result.unit_cost = stmt.column_decimal(7);
  result.balance_before = stmt.column_decimal(8);
  result.balance_after = stmt.column_decimal(9);
  result.source_type = stmt.column_text(10);
  result.source_id = stmt.column_text(11);
  result.lock_id = stmt.column_optional_uuid(12);
  result.reason = stmt.column_text(13);
  result.created_at = stmt.column_timestamp(14);
  return result;
}

} // namespace

std::string to_string(movement_type x) {
  return std::string{movement_type_names[static_cast<uint8_t>(x)]};
}

bool from_string(std::string_view name, movement_type& x) {
  for (size_t i = 0; i < std::size(movement_type_names); ++i) {
    if (name == movement_type_names[i]) {
      x = static_cast<movement_type>(i);
      return true;
    }
  }
  return false;
}

bool from_integer(uint8_t value, movement_type& x) {
  if (value < std::size(movement_type_names)) {
    x = static_cast<movement_type>(value);
    return true;
  }
  return false;
}

caf::error stock_ledger::append(ledger_entry entry) {
  if (entry.id.is_nil())
    entry.id = caf::uuid::random();
  auto type_name = to_string(entry.type);
  auto stmt = db_->prepare(insert_sql, entry.id, entry.tenant_id,
                           entry.inventory_item_id, entry.warehouse_id,
                           entry.product_id, type_name, entry.amount,
                           entry.unit_cost, entry.balance_before,
                           entry.balance_after, entry.source_type,
                           entry.source_id, entry.lock_id, entry.reason,
                           entry.created_at);
  if (!stmt)
    return std::move(stmt.error());
  if (auto res = stmt->step(); res != SQLITE_DONE)
    return db_->make_error(res, "append ledger entry");
  return caf::error{};
}

caf::expected<std::vector<ledger_entry>>
stock_ledger::find_by_item(const caf::uuid& inventory_item_id) {
  auto stmt = db_->prepare(select_by_item_sql, inventory_item_id);
  if (!stmt)
    return std::move(stmt.error());
  return fetch_all(*stmt);
}

caf::expected<std::vector<ledger_entry>>
stock_ledger::find_by_source(std::string_view source_type,
                             std::string_view source_id) {
  auto stmt = db_->prepare(select_by_source_sql, source_type, source_id);
  if (!stmt)
    return std::move(stmt.error());
  return fetch_all(*stmt);
}

caf::expected<std::vector<ledger_entry>>
stock_ledger::fetch_all(statement& stmt) {
  std::vector<ledger_entry> result;
  auto res = stmt.step();
  for (; res == SQLITE_ROW; res = stmt.step()) {
    auto entry = read_entry(stmt);
    if (!entry)
      return std::move(entry.error());
    result.push_back(std::move(*entry));
  }
  if (res != SQLITE_DONE)
    return db_->make_error(res, "find ledger entries");
  return result;
}

} // namespace stockpile
