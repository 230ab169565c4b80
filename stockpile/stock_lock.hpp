// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/decimal.hpp"

#include <caf/default_enum_inspect.hpp>
#include <caf/error.hpp>
#include <caf/timestamp.hpp>
#include <caf/uuid.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace stockpile {

/// Lifecycle of a stock lock. `released` and `consumed` are terminal.
enum class lock_state : uint8_t {
  active,
  released,
  consumed,
};

/// @relates lock_state
std::string to_string(lock_state);

/// @relates lock_state
bool from_string(std::string_view, lock_state&);

/// @relates lock_state
bool from_integer(uint8_t, lock_state&);

/// @relates lock_state
template <class Inspector>
bool inspect(Inspector& f, lock_state& x) {
  return caf::default_enum_inspect(f, x);
}

/// Reserves a quantity of one inventory item for a source document, e.g.,
/// a sales order. Locks reference their item by ID only.
struct stock_lock {
  caf::uuid id;
  caf::uuid inventory_item_id;
  quantity amount;
  std::string source_type;
  std::string source_id;
  caf::timestamp expire_at;
  lock_state state = lock_state::active;
  caf::timestamp created_at;
  std::optional<caf::timestamp> released_at;

  bool is_active() const noexcept {
    return state == lock_state::active;
  }

  /// Checks whether this lock is still active but past its expiry at `now`.
  bool is_expired_at(caf::timestamp now) const noexcept {
    return is_active() && expire_at < now;
  }

  /// Transitions from `active` to `released`.
  /// @returns `ec::invalid_lock_state` if the lock is no longer active.
  caf::error release(caf::timestamp now);

  /// Transitions from `active` to `consumed`.
  /// @returns `ec::invalid_lock_state` if the lock is no longer active.
  caf::error consume();
};

template <class Inspector>
bool inspect(Inspector& f, stock_lock& x) {
  return f.object(x).fields(f.field("id", x.id),
                            f.field("inventory-item-id", x.inventory_item_id),
                            f.field("quantity", x.amount),
                            f.field("source-type", x.source_type),
                            f.field("source-id", x.source_id),
                            f.field("expire-at", x.expire_at),
                            f.field("state", x.state),
                            f.field("created-at", x.created_at),
                            f.field("released-at", x.released_at));
}

} // namespace stockpile
