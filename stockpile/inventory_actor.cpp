// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/inventory_actor.hpp"

#include "stockpile/ec.hpp"
#include "stockpile/log.hpp"

#include <caf/actor_from_state.hpp>
#include <caf/actor_system.hpp>
#include <caf/error.hpp>

#include <optional>
#include <utility>

namespace stockpile {

namespace {

template <class T>
caf::result<T> to_result(caf::expected<T>&& value) {
  if (value)
    return {std::move(*value)};
  return {std::move(value.error())};
}

caf::result<void> to_result(caf::error&& err) {
  if (err)
    return {std::move(err)};
  return {};
}

struct inventory_actor_state {
  inventory_actor_state(inventory_actor::pointer self_ptr, database_ptr db_ptr,
                        service_options opts)
    : self(self_ptr), db(std::move(db_ptr)), service(*db, opts) {
    // nop
  }

  inventory_actor::behavior_type make_behavior();

  inventory_actor::pointer self;
  database_ptr db;
  inventory_service service;
};

inventory_actor::behavior_type inventory_actor_state::make_behavior() {
  return {
    [this](caf::get_atom, const item_key& key) -> caf::result<inventory_item> {
      return to_result(service.get(key));
    },
    [this](lock_atom, const item_key& key, quantity amount,
           std::string source_type, std::string source_id,
           caf::timestamp expire_at) -> caf::result<stock_lock> {
      auto deadline = std::optional<caf::timestamp>{};
      if (expire_at != caf::timestamp{})
        deadline = expire_at;
      return to_result(service.lock_stock(key, amount, std::move(source_type),
                                          std::move(source_id), deadline));
    },
    [this](unlock_atom, const caf::uuid& tenant_id,
           const caf::uuid& lock_id) -> caf::result<void> {
      return to_result(service.unlock_stock(tenant_id, lock_id));
    },
    [this](deduct_atom, const caf::uuid& tenant_id,
           const caf::uuid& lock_id) -> caf::result<void> {
      return to_result(service.deduct_stock(tenant_id, lock_id));
    },
    [this](increase_atom, const item_key& key, quantity amount,
           decimal unit_cost, const std::string& source_type,
           const std::string& source_id) -> caf::result<inventory_item> {
      return to_result(
        service.increase_stock(key, amount, unit_cost, source_type, source_id));
    },
    [this](increase_atom, const item_key& key, quantity amount,
           decimal unit_cost, const std::string& source_type,
           const std::string& source_id,
           const batch_info& batch) -> caf::result<inventory_item> {
      return to_result(service.increase_stock(key, amount, unit_cost,
                                              source_type, source_id, batch));
    },
    [this](decrease_atom, const item_key& key, quantity amount,
           const std::string& source_type, const std::string& source_id,
           const std::string& reason) -> caf::result<inventory_item> {
      return to_result(service.decrease_stock(key, amount, source_type,
                                              source_id, reason));
    },
    [this](adjust_atom, const item_key& key, quantity actual,
           const std::string& reason) -> caf::result<inventory_item> {
      return to_result(service.adjust_stock(key, actual, reason));
    },
    [this](release_source_atom, const caf::uuid& tenant_id,
           const std::string& source_type,
           const std::string& source_id) -> caf::result<uint64_t> {
      auto count = service.release_source(tenant_id, source_type, source_id);
      if (!count)
        return {std::move(count.error())};
      return static_cast<uint64_t>(*count);
    },
    [this](sweep_atom) -> caf::result<uint64_t> {
      auto count = service.release_expired_locks(caf::make_timestamp());
      if (!count) {
        log::error("failed to release expired locks: {}",
                   to_string(count.error()));
        return {std::move(count.error())};
      }
      return static_cast<uint64_t>(*count);
    },
  };
}

} // namespace

inventory_actor spawn_inventory_actor(caf::actor_system& sys, database_ptr db,
                                      service_options opts) {
  // Note: the actor uses a blocking API (SQLite3) and thus should run in its
  //       own thread.
  using caf::actor_from_state;
  using caf::detached;
  return sys.spawn<detached>(actor_from_state<inventory_actor_state>,
                             std::move(db), opts);
}

} // namespace stockpile
