// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/database.hpp"
#include "stockpile/decimal.hpp"
#include "stockpile/inventory_item.hpp"
#include "stockpile/inventory_service.hpp"
#include "stockpile/stock_batch.hpp"
#include "stockpile/stock_lock.hpp"
#include "stockpile/types.hpp"

#include <caf/fwd.hpp>
#include <caf/result.hpp>
#include <caf/timestamp.hpp>
#include <caf/type_list.hpp>
#include <caf/typed_actor.hpp>
#include <caf/uuid.hpp>

#include <cstdint>
#include <string>

namespace stockpile {

struct inventory_trait {
  using signatures = caf::type_list<
    // Retrieves an item together with its active locks.
    caf::result<inventory_item>(caf::get_atom, item_key),
    // Locks stock of an item. A zero timestamp selects the default expiry.
    caf::result<stock_lock>(lock_atom, item_key, quantity, std::string,
                            std::string, caf::timestamp),
    // Unlocks a lock of a tenant.
    caf::result<void>(unlock_atom, caf::uuid, caf::uuid),
    // Deducts the quantity of a lock of a tenant.
    caf::result<void>(deduct_atom, caf::uuid, caf::uuid),
    // Receives stock at a unit cost for a source document.
    caf::result<inventory_item>(increase_atom, item_key, quantity, decimal,
                                std::string, std::string),
    // Receives stock and records the batch of the received goods.
    caf::result<inventory_item>(increase_atom, item_key, quantity, decimal,
                                std::string, std::string, batch_info),
    // Removes available stock for a source document with a reason.
    caf::result<inventory_item>(decrease_atom, item_key, quantity, std::string,
                                std::string, std::string),
    // Sets the available quantity with a reason.
    caf::result<inventory_item>(adjust_atom, item_key, quantity, std::string),
    // Unlocks all active locks of a source document of a tenant.
    caf::result<uint64_t>(release_source_atom, caf::uuid, std::string,
                          std::string),
    // Releases all expired locks.
    caf::result<uint64_t>(sweep_atom)>;
};

/// Serializes all access to one database connection.
using inventory_actor = caf::typed_actor<inventory_trait>;

/// Spawns an inventory actor that owns `db` exclusively.
inventory_actor spawn_inventory_actor(caf::actor_system& sys, database_ptr db,
                                      service_options opts);

} // namespace stockpile
