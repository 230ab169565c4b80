// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/inventory_service.hpp"

#include <utility>

namespace stockpile {

namespace {

ledger_entry make_entry(const inventory_item& item, movement_type type,
                        decimal amount, quantity balance_before,
                        std::string source_type, std::string source_id) {
  ledger_entry result;
  result.tenant_id = item.key().tenant_id;
  result.inventory_item_id = item.id();
  result.warehouse_id = item.key().warehouse_id;
  result.product_id = item.key().product_id;
  result.type = type;
  result.amount = amount;
  result.unit_cost = item.unit_cost();
  result.balance_before = balance_before.value();
  result.balance_after = item.available().value();
  result.source_type = std::move(source_type);
  result.source_id = std::move(source_id);
  result.created_at = caf::make_timestamp();
  return result;
}

// Loads a lock together with its item and attaches the lock to the item.
// Locks of other tenants are invisible.
caf::expected<inventory_item> load_lock_owner(transactional_stores& db,
                                              const caf::uuid& tenant_id,
                                              const caf::uuid& lock_id) {
  auto lock = db.locks.find_by_id(lock_id);
  if (!lock)
    return std::move(lock.error());
  auto item = db.items.find_by_id(lock->inventory_item_id);
  if (!item)
    return std::move(item.error());
  if (item->key().tenant_id != tenant_id)
    return caf::make_error(ec::no_such_lock, "no lock " + to_string(lock_id));
  if (auto err = item->attach_lock(std::move(*lock)))
    return err;
  return item;
}

// Persists an item after a change to one of its locks and records the
// movement in the ledger.
caf::error save_lock_change(transactional_stores& db,
                            const inventory_item& item,
                            const caf::uuid& lock_id, movement_type type,
                            quantity balance_before) {
  const auto* lock = item.find_lock(lock_id);
  if (lock == nullptr)
    return caf::make_error(ec::no_such_lock, "no lock " + to_string(lock_id));
  if (auto err = db.items.save_with_lock(item))
    return err;
  if (auto err = db.locks.save(*lock))
    return err;
  auto entry = make_entry(item, type, lock->amount.value(), balance_before,
                          lock->source_type, lock->source_id);
  entry.lock_id = lock->id;
  return db.ledger.append(std::move(entry));
}

caf::error unlock_one(transactional_stores& db, const caf::uuid& tenant_id,
                      const caf::uuid& lock_id) {
  auto item = load_lock_owner(db, tenant_id, lock_id);
  if (!item)
    return std::move(item.error());
  auto before = item->available();
  if (auto err = item->unlock_stock(lock_id))
    return err;
  return save_lock_change(db, *item, lock_id, movement_type::unlock, before);
}

} // namespace

caf::expected<stock_lock>
inventory_service::lock_stock(const item_key& key, quantity amount,
                              std::string source_type, std::string source_id,
                              std::optional<caf::timestamp> expire_at) {
  auto deadline = expire_at.value_or(caf::make_timestamp()
                                     + opts_.default_lock_expiry);
  stock_lock result;
  auto err = transact([&](transactional_stores& db) -> caf::error {
    auto item = db.items.find_by_warehouse_and_product(key);
    if (!item)
      return std::move(item.error());
    auto before = item->available();
    auto lock = item->lock_stock(amount, source_type, source_id, deadline);
    if (!lock)
      return std::move(lock.error());
    if (auto err = db.items.save_with_lock(*item))
      return err;
    if (auto err = db.locks.save(*lock))
      return err;
    auto entry = make_entry(*item, movement_type::lock, amount.value(), before,
                            source_type, source_id);
    entry.lock_id = lock->id;
    if (auto err = db.ledger.append(std::move(entry)))
      return err;
    result = std::move(*lock);
    return caf::error{};
  });
  if (err)
    return err;
  log::debug("locked {} of item {} for {}/{}", to_string(amount),
             to_string(result.inventory_item_id), result.source_type,
             result.source_id);
  return result;
}

caf::error inventory_service::unlock_stock(const caf::uuid& tenant_id,
                                           const caf::uuid& lock_id) {
  return transact([&](transactional_stores& db) {
    return unlock_one(db, tenant_id, lock_id);
  });
}

caf::error inventory_service::deduct_stock(const caf::uuid& tenant_id,
                                           const caf::uuid& lock_id) {
  return transact([&](transactional_stores& db) -> caf::error {
    auto item = load_lock_owner(db, tenant_id, lock_id);
    if (!item)
      return std::move(item.error());
    auto before = item->available();
    if (auto err = item->deduct_stock(lock_id))
      return err;
    return save_lock_change(db, *item, lock_id, movement_type::outbound,
                            before);
  });
}

caf::expected<size_t>
inventory_service::release_source(const caf::uuid& tenant_id,
                                  const std::string& source_type,
                                  const std::string& source_id) {
  size_t result = 0;
  auto err = transact([&](transactional_stores& db) -> caf::error {
    result = 0;
    auto locks = db.locks.find_by_source(source_type, source_id);
    if (!locks)
      return std::move(locks.error());
    for (const auto& lock : *locks) {
      auto err = unlock_one(db, tenant_id, lock.id);
      if (err == ec::no_such_lock)
        continue; // Belongs to another tenant.
      if (err)
        return err;
      ++result;
    }
    return caf::error{};
  });
  if (err)
    return err;
  return result;
}

caf::expected<inventory_item>
inventory_service::increase_stock(const item_key& key, quantity amount,
                                  decimal unit_cost,
                                  const std::string& source_type,
                                  const std::string& source_id,
                                  const std::optional<batch_info>& batch) {
  inventory_item result;
  auto err = transact([&](transactional_stores& db) -> caf::error {
    auto item = db.items.get_or_create(key);
    if (!item)
      return std::move(item.error());
    auto before = item->available();
    if (auto err = item->increase_stock(amount, unit_cost, source_id, batch))
      return err;
    if (auto err = db.items.save_with_lock(*item))
      return err;
    for (const auto& received : item->batches())
      if (auto err = db.batches.save(received))
        return err;
    auto entry = make_entry(*item, movement_type::inbound, amount.value(),
                            before, source_type, source_id);
    entry.unit_cost = unit_cost;
    if (auto err = db.ledger.append(std::move(entry)))
      return err;
    result = std::move(*item);
    return caf::error{};
  });
  if (err)
    return err;
  return result;
}

caf::expected<inventory_item>
inventory_service::decrease_stock(const item_key& key, quantity amount,
                                  const std::string& source_type,
                                  const std::string& source_id,
                                  const std::string& reason) {
  inventory_item result;
  auto err = transact([&](transactional_stores& db) -> caf::error {
    auto item = db.items.find_by_warehouse_and_product(key);
    if (!item)
      return std::move(item.error());
    auto before = item->available();
    if (auto err = item->decrease_stock(amount, source_type, source_id,
                                        reason))
      return err;
    if (auto err = db.items.save_with_lock(*item))
      return err;
    auto entry = make_entry(*item, movement_type::outbound, amount.value(),
                            before, source_type, source_id);
    entry.reason = reason;
    if (auto err = db.ledger.append(std::move(entry)))
      return err;
    result = std::move(*item);
    return caf::error{};
  });
  if (err)
    return err;
  return result;
}

caf::expected<inventory_item>
inventory_service::adjust_stock(const item_key& key, quantity actual,
                                const std::string& reason) {
  inventory_item result;
  auto err = transact([&](transactional_stores& db) -> caf::error {
    auto item = db.items.find_by_warehouse_and_product(key);
    if (!item)
      return std::move(item.error());
    auto before = item->available();
    if (auto err = item->adjust_stock(actual, reason))
      return err;
    if (auto err = db.items.save_with_lock(*item))
      return err;
    if (actual != before) {
      auto type = actual > before ? movement_type::adjustment_increase
                                  : movement_type::adjustment_decrease;
      auto delta = actual > before ? actual.value() - before.value()
                                   : before.value() - actual.value();
      auto entry = make_entry(*item, type, delta, before, "adjustment",
                              to_string(item->id()));
      entry.reason = reason;
      if (auto err = db.ledger.append(std::move(entry)))
        return err;
    }
    result = std::move(*item);
    return caf::error{};
  });
  if (err)
    return err;
  return result;
}

caf::expected<inventory_item>
inventory_service::set_thresholds(const item_key& key, quantity min_qty,
                                  quantity max_qty) {
  inventory_item result;
  auto err = transact([&](transactional_stores& db) -> caf::error {
    auto item = db.items.find_by_warehouse_and_product(key);
    if (!item)
      return std::move(item.error());
    if (auto err = item->set_thresholds(min_qty, max_qty))
      return err;
    if (auto err = db.items.save_with_lock(*item))
      return err;
    result = std::move(*item);
    return caf::error{};
  });
  if (err)
    return err;
  return result;
}

caf::expected<inventory_item> inventory_service::get(const item_key& key) {
  inventory_item result;
  auto err = scope_.execute([&](transactional_stores& db) -> caf::error {
    auto item = db.items.find_by_warehouse_and_product(key);
    if (!item)
      return std::move(item.error());
    auto locks = db.locks.find_active(item->id());
    if (!locks)
      return std::move(locks.error());
    for (auto& lock : *locks)
      if (auto err = item->attach_lock(std::move(lock)))
        return err;
    result = std::move(*item);
    return caf::error{};
  });
  if (err)
    return err;
  return result;
}

caf::expected<std::vector<stock_lock>>
inventory_service::active_locks(const item_key& key) {
  auto item = get(key);
  if (!item)
    return std::move(item.error());
  return item->active_locks();
}

caf::expected<std::vector<ledger_entry>>
inventory_service::history(const item_key& key) {
  std::vector<ledger_entry> result;
  auto err = scope_.execute([&](transactional_stores& db) -> caf::error {
    auto item = db.items.find_by_warehouse_and_product(key);
    if (!item)
      return std::move(item.error());
    auto entries = db.ledger.find_by_item(item->id());
    if (!entries)
      return std::move(entries.error());
    result = std::move(*entries);
    return caf::error{};
  });
  if (err)
    return err;
  return result;
}

caf::expected<std::vector<stock_batch>>
inventory_service::batches(const item_key& key) {
  std::vector<stock_batch> result;
  auto err = scope_.execute([&](transactional_stores& db) -> caf::error {
    auto item = db.items.find_by_warehouse_and_product(key);
    if (!item)
      return std::move(item.error());
    auto found = db.batches.find_by_item(item->id());
    if (!found)
      return std::move(found.error());
    result = std::move(*found);
    return caf::error{};
  });
  if (err)
    return err;
  return result;
}

caf::expected<size_t>
inventory_service::release_expired_locks(caf::timestamp now) {
  size_t result = 0;
  auto err = transact([&](transactional_stores& db) -> caf::error {
    auto count = db.locks.release_expired(now);
    if (!count)
      return std::move(count.error());
    result = *count;
    return caf::error{};
  });
  if (err)
    return err;
  return result;
}

} // namespace stockpile
