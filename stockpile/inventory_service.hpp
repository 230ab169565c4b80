// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/database.hpp"
#include "stockpile/decimal.hpp"
#include "stockpile/ec.hpp"
#include "stockpile/inventory_item.hpp"
#include "stockpile/log.hpp"
#include "stockpile/stock_batch.hpp"
#include "stockpile/stock_ledger.hpp"
#include "stockpile/stock_lock.hpp"
#include "stockpile/transaction_scope.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/timespan.hpp>
#include <caf/timestamp.hpp>
#include <caf/uuid.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stockpile {

/// Runs `fn` again as long as it fails with `ec::optimistic_lock_conflict`,
/// up to `max_attempts` runs in total. Returns any other result immediately.
template <class F>
caf::error retry_on_conflict(size_t max_attempts, F&& fn) {
  max_attempts = std::max(max_attempts, size_t{1});
  auto err = caf::error{};
  for (size_t attempt = 1; attempt <= max_attempts; ++attempt) {
    err = fn();
    if (err != ec::optimistic_lock_conflict)
      return err;
    log::warning("attempt {} of {} failed with a version conflict", attempt,
                 max_attempts);
  }
  return err;
}

/// Tuning knobs of the inventory service.
struct service_options {
  /// Expiry of a lock when the caller passes none.
  caf::timespan default_lock_expiry = std::chrono::minutes{30};

  /// Maximum runs of a workflow step when it hits version conflicts.
  size_t max_attempts = 3;

  /// Maximum duration of a single transaction.
  caf::timespan transaction_timeout = std::chrono::seconds{5};
};

/// Fulfillment and procurement workflows on top of the stores. Each
/// operation runs in one transaction that also appends the ledger entries
/// for the movement.
class inventory_service {
public:
  explicit inventory_service(database& db, service_options opts = {})
    : scope_(db), opts_(opts) {
    // nop
  }

  /// Reserves `amount` of an existing item for a source document.
  /// @returns `ec::no_such_item` if no item exists for `key`.
  caf::expected<stock_lock>
  lock_stock(const item_key& key, quantity amount, std::string source_type,
             std::string source_id,
             std::optional<caf::timestamp> expire_at = std::nullopt);

  /// Returns the quantity of a lock to the available stock.
  /// @returns `ec::no_such_lock` if the lock does not exist for this tenant.
  caf::error unlock_stock(const caf::uuid& tenant_id, const caf::uuid& lock_id);

  /// Ships the quantity of a lock, i.e., removes it from the stock.
  /// @returns `ec::no_such_lock` if the lock does not exist for this tenant.
  caf::error deduct_stock(const caf::uuid& tenant_id, const caf::uuid& lock_id);

  /// Unlocks all active locks of a cancelled source document.
  /// @returns the number of released locks.
  caf::expected<size_t> release_source(const caf::uuid& tenant_id,
                                       const std::string& source_type,
                                       const std::string& source_id);

  /// Receives stock, creating the item on first use. Records the batch of
  /// the received goods if `batch` is set.
  caf::expected<inventory_item>
  increase_stock(const item_key& key, quantity amount, decimal unit_cost,
                 const std::string& source_type, const std::string& source_id,
                 const std::optional<batch_info>& batch = std::nullopt);

  /// Removes available stock without a prior lock, e.g., for a purchase
  /// return.
  /// @returns `ec::no_such_item` if no item exists for `key`.
  caf::expected<inventory_item>
  decrease_stock(const item_key& key, quantity amount,
                 const std::string& source_type, const std::string& source_id,
                 const std::string& reason);

  /// Sets the available quantity of an item after a physical count.
  caf::expected<inventory_item>
  adjust_stock(const item_key& key, quantity actual, const std::string& reason);

  caf::expected<inventory_item>
  set_thresholds(const item_key& key, quantity min_qty, quantity max_qty);

  /// Returns an item together with its active locks.
  caf::expected<inventory_item> get(const item_key& key);

  caf::expected<std::vector<stock_lock>> active_locks(const item_key& key);

  caf::expected<std::vector<ledger_entry>> history(const item_key& key);

  caf::expected<std::vector<stock_batch>> batches(const item_key& key);

  /// Releases all expired locks across all items.
  caf::expected<size_t> release_expired_locks(caf::timestamp now);

  const service_options& options() const noexcept {
    return opts_;
  }

private:
  template <class F>
  caf::error transact(F&& fn) {
    return retry_on_conflict(opts_.max_attempts, [this, &fn] {
      return scope_.execute(opts_.transaction_timeout, fn);
    });
  }

  transaction_scope scope_;
  service_options opts_;
};

} // namespace stockpile
