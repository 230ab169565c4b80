// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/decimal.hpp"

#include <caf/timestamp.hpp>
#include <caf/uuid.hpp>

#include <optional>
#include <string>

namespace stockpile {

/// Identifies the production batch of received stock.
struct batch_info {
  std::string batch_number;
  std::optional<caf::timestamp> production_date;
  std::optional<caf::timestamp> expiry_date;
};

template <class Inspector>
bool inspect(Inspector& f, batch_info& x) {
  return f.object(x).fields(f.field("batch-number", x.batch_number),
                            f.field("production-date", x.production_date),
                            f.field("expiry-date", x.expiry_date));
}

/// A quantity of one inventory item received in a single batch.
struct stock_batch {
  caf::uuid id;
  caf::uuid inventory_item_id;
  std::string batch_number;
  std::optional<caf::timestamp> production_date;
  std::optional<caf::timestamp> expiry_date;
  quantity amount;
  decimal unit_cost;
  bool consumed = false;
  caf::timestamp created_at;
};

template <class Inspector>
bool inspect(Inspector& f, stock_batch& x) {
  return f.object(x).fields(f.field("id", x.id),
                            f.field("inventory-item-id", x.inventory_item_id),
                            f.field("batch-number", x.batch_number),
                            f.field("production-date", x.production_date),
                            f.field("expiry-date", x.expiry_date),
                            f.field("quantity", x.amount),
                            f.field("unit-cost", x.unit_cost),
                            f.field("consumed", x.consumed),
                            f.field("created-at", x.created_at));
}

} // namespace stockpile
