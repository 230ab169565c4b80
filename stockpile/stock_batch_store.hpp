// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/database.hpp"
#include "stockpile/stock_batch.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/uuid.hpp>

#include <vector>

namespace stockpile {

/// Persists the batches of received stock (`stock_batches`).
class stock_batch_store {
public:
  explicit stock_batch_store(database& db) : db_(&db) {
    // nop
  }

  /// Inserts a new batch or updates the `consumed` flag of an existing one.
  caf::error save(const stock_batch& batch);

  /// Returns all batches of an item in the order they were received.
  caf::expected<std::vector<stock_batch>>
  find_by_item(const caf::uuid& inventory_item_id);

private:
  database* db_;
};

} // namespace stockpile
