// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/inventory_actor.hpp"

#include <caf/fwd.hpp>
#include <caf/timespan.hpp>

namespace stockpile {

/// Spawns an actor that asks `inventory` to release expired locks every
/// `interval` and gives up on a sweep after `timeout`. The sweeper stops when
/// the inventory actor terminates.
caf::actor spawn_sweeper(caf::actor_system& sys, inventory_actor inventory,
                         caf::timespan interval, caf::timespan timeout);

} // namespace stockpile
