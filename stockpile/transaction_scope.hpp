// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/database.hpp"
#include "stockpile/inventory_item_store.hpp"
#include "stockpile/stock_batch_store.hpp"
#include "stockpile/stock_ledger.hpp"
#include "stockpile/stock_lock_store.hpp"

#include <caf/error.hpp>
#include <caf/timespan.hpp>

#include <functional>
#include <optional>

namespace stockpile {

/// Stores bound to the connection of a running transaction.
struct transactional_stores {
  inventory_item_store& items;
  stock_lock_store& locks;
  stock_batch_store& batches;
  stock_ledger& ledger;
};

/// Runs a unit of work in a single database transaction. All writes of the
/// work either persist together or not at all.
class transaction_scope {
public:
  /// The unit of work. Returning an error rolls back the transaction.
  using work = std::function<caf::error(transactional_stores&)>;

  explicit transaction_scope(database& db) : db_(&db) {
    // nop
  }

  /// Runs `fn` in a new transaction and commits if `fn` returns no error.
  /// @returns the error of `fn`, `ec::invalid_argument` if the connection
  ///          already runs a transaction or any error of the database.
  caf::error execute(const work& fn);

  /// Like `execute(fn)`, but interrupts any statement still running after
  /// `timeout` and returns `ec::deadline_exceeded` after rolling back if
  /// the deadline passed before the commit.
  caf::error execute(caf::timespan timeout, const work& fn);

private:
  caf::error run(std::optional<caf::timestamp> deadline, const work& fn);

  database* db_;
};

} // namespace stockpile
