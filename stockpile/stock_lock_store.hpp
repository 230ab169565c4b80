// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/database.hpp"
#include "stockpile/stock_lock.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/timestamp.hpp>
#include <caf/uuid.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace stockpile {

/// Persists stock locks in the `stock_locks` table. Each lock references its
/// inventory item by ID and is stored independently of the item row.
class stock_lock_store {
public:
  explicit stock_lock_store(database& db) : db_(&db) {
    // nop
  }

  /// @returns `ec::no_such_lock` if no lock has this ID.
  caf::expected<stock_lock> find_by_id(const caf::uuid& id);

  /// Returns all locks of an item that are neither released nor consumed.
  caf::expected<std::vector<stock_lock>>
  find_active(const caf::uuid& inventory_item_id);

  /// Returns all active locks held for a source document.
  caf::expected<std::vector<stock_lock>>
  find_by_source(std::string_view source_type, std::string_view source_id);

  /// Returns all active locks across all items with an expiry before `now`.
  caf::expected<std::vector<stock_lock>> find_expired(caf::timestamp now);

  /// Inserts a new lock or updates the state of an existing one.
  caf::error save(const stock_lock& lock);

  /// Releases every active lock with an expiry before `now`, across all
  /// items, without loading any aggregate. Moves the expired quantity of
  /// each affected item from locked back to available and increments the
  /// version of that item once. Runs in a savepoint, i.e., either all
  /// changes apply or none.
  /// @returns the number of released locks.
  caf::expected<size_t> release_expired(caf::timestamp now);

private:
  caf::expected<std::vector<stock_lock>> fetch_all(statement& stmt);

  caf::expected<size_t> release_expired_impl(caf::timestamp now);

  database* db_;
};

} // namespace stockpile
