// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/sweeper.hpp"

#include "stockpile/log.hpp"

#include <caf/actor.hpp>
#include <caf/actor_system.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/scheduled_actor/flow.hpp>

#include <cstdint>

namespace stockpile {

caf::actor spawn_sweeper(caf::actor_system& sys, inventory_actor inventory,
                         caf::timespan interval, caf::timespan timeout) {
  return sys.spawn([inventory, interval,
                    timeout](caf::event_based_actor* self) {
    // Stop if the inventory actor terminates.
    self->monitor(inventory, [self](const caf::error& reason) {
      log::info("sweeper lost the inventory actor: {}", to_string(reason));
      self->quit(reason);
    });
    // Trigger a sweep on each tick. The inventory actor runs one sweep at a
    // time, so slow sweeps only delay the next one.
    self->make_observable()
      .interval(interval)
      .for_each([self, inventory, timeout](int64_t) {
        self->request(inventory, timeout, sweep_atom_v)
          .then(
            [](uint64_t count) {
              if (count > 0)
                log::info("sweeper released {} expired locks", count);
            },
            [](const caf::error& what) {
              log::error("sweep failed: {}", to_string(what));
            });
      });
  });
}

} // namespace stockpile
