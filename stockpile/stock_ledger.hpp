// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/database.hpp"
#include "stockpile/decimal.hpp"

#include <caf/default_enum_inspect.hpp>
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

/// Kind of a stock movement in the ledger.
enum class movement_type : uint8_t {
  inbound,
  outbound,
  adjustment_increase,
  adjustment_decrease,
  lock,
  unlock,
};

/// @relates movement_type
std::string to_string(movement_type);

/// @relates movement_type
bool from_string(std::string_view, movement_type&);

/// @relates movement_type
bool from_integer(uint8_t, movement_type&);

/// @relates movement_type
template <class Inspector>
bool inspect(Inspector& f, movement_type& x) {
  return caf::default_enum_inspect(f, x);
}

/// One row of the movement history. The balance columns refer to the
/// available quantity of the item.
struct ledger_entry {
  caf::uuid id;
  caf::uuid tenant_id;
  caf::uuid inventory_item_id;
  caf::uuid warehouse_id;
  caf::uuid product_id;
  movement_type type = movement_type::inbound;
  decimal amount;
  decimal unit_cost;
  decimal balance_before;
  decimal balance_after;
  std::string source_type;
  std::string source_id;
  std::optional<caf::uuid> lock_id;
  std::string reason;
  caf::timestamp created_at;
};

template <class Inspector>
bool inspect(Inspector& f, ledger_entry& x) {
  return f.object(x).fields(f.field("id", x.id),
                            f.field("tenant-id", x.tenant_id),
                            f.field("inventory-item-id", x.inventory_item_id),
                            f.field("warehouse-id", x.warehouse_id),
                            f.field("product-id", x.product_id),
                            f.field("type", x.type),
                            f.field("quantity", x.amount),
                            f.field("unit-cost", x.unit_cost),
                            f.field("balance-before", x.balance_before),
                            f.field("balance-after", x.balance_after),
                            f.field("source-type", x.source_type),
                            f.field("source-id", x.source_id),
                            f.field("lock-id", x.lock_id),
                            f.field("reason", x.reason),
                            f.field("created-at", x.created_at));
}

/// Append-only history of stock movements (`inventory_transactions`).
class stock_ledger {
public:
  explicit stock_ledger(database& db) : db_(&db) {
    // nop
  }

  /// Adds `entry` to the history. Assigns a random ID if `entry.id` is nil.
  caf::error append(ledger_entry entry);

  /// Returns all movements of an item in insertion order.
  caf::expected<std::vector<ledger_entry>>
  find_by_item(const caf::uuid& inventory_item_id);

  /// Returns all movements caused by a source document in insertion order.
  caf::expected<std::vector<ledger_entry>>
  find_by_source(std::string_view source_type, std::string_view source_id);

private:
  caf::expected<std::vector<ledger_entry>> fetch_all(statement& stmt);

  database* db_;
};

} // namespace stockpile
