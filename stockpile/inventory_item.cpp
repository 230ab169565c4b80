// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/inventory_item.hpp"

#include "stockpile/ec.hpp"
#include "stockpile/log.hpp"

#include <algorithm>
#include <iterator>

namespace stockpile {

caf::expected<inventory_item> inventory_item::make(const item_key& key) {
  if (key.warehouse_id.is_nil())
    return caf::make_error(ec::invalid_argument, "warehouse ID is required");
  if (key.product_id.is_nil())
    return caf::make_error(ec::invalid_argument, "product ID is required");
  auto now = caf::make_timestamp();
  inventory_item result;
  result.row_.id = caf::uuid::random();
  result.row_.key = key;
  result.row_.version = 1;
  result.row_.created_at = now;
  result.row_.updated_at = now;
  return result;
}

inventory_item inventory_item::from_row(inventory_row row) {
  inventory_item result;
  result.row_ = std::move(row);
  return result;
}

bool inventory_item::is_below_minimum() const noexcept {
  auto min_qty = row_.min_quantity.value();
  return min_qty.is_positive() && total_quantity() < min_qty;
}

bool inventory_item::is_above_maximum() const noexcept {
  auto max_qty = row_.max_quantity.value();
  return max_qty.is_positive() && total_quantity() > max_qty;
}

const stock_lock*
inventory_item::find_lock(const caf::uuid& lock_id) const noexcept {
  auto i = std::find_if(locks_.begin(), locks_.end(),
                        [&lock_id](const auto& x) { return x.id == lock_id; });
  return i != locks_.end() ? &*i : nullptr;
}

std::vector<stock_lock> inventory_item::active_locks() const {
  std::vector<stock_lock> result;
  std::copy_if(locks_.begin(), locks_.end(), std::back_inserter(result),
               [](const auto& x) { return x.is_active(); });
  return result;
}

caf::error inventory_item::attach_lock(stock_lock lock) {
  if (lock.inventory_item_id != row_.id)
    return caf::make_error(ec::invalid_argument,
                           "lock " + to_string(lock.id)
                             + " belongs to another inventory item");
  if (find_lock(lock.id) != nullptr)
    return caf::make_error(ec::invalid_argument,
                           "lock " + to_string(lock.id) + " already attached");
  locks_.push_back(std::move(lock));
  return caf::error{};
}

caf::expected<stock_lock> inventory_item::lock_stock(quantity amount,
                                                     std::string source_type,
                                                     std::string source_id,
                                                     caf::timestamp expire_at) {
  if (amount.is_zero())
    return caf::make_error(ec::invalid_argument,
                           "lock quantity must be positive");
  if (!can_fulfill(amount))
    return caf::make_error(ec::insufficient_stock,
                           "cannot lock " + to_string(amount) + " of "
                             + to_string(row_.available) + " available");
  if (source_type.empty() || source_id.empty())
    return caf::make_error(ec::invalid_argument,
                           "source type and ID are required");
  auto new_available = row_.available.sub(amount);
  if (!new_available)
    return std::move(new_available.error());
  auto new_locked = row_.locked.add(amount);
  if (!new_locked)
    return std::move(new_locked.error());
  auto now = caf::make_timestamp();
  stock_lock lock;
  lock.id = caf::uuid::random();
  lock.inventory_item_id = row_.id;
  lock.amount = amount;
  lock.source_type = std::move(source_type);
  lock.source_id = std::move(source_id);
  lock.expire_at = expire_at;
  lock.created_at = now;
  row_.available = *new_available;
  row_.locked = *new_locked;
  locks_.push_back(lock);
  touch(now);
  return lock;
}

caf::error inventory_item::unlock_stock(const caf::uuid& lock_id) {
  auto* lock = lookup_lock(lock_id);
  if (lock == nullptr)
    return caf::make_error(ec::no_such_lock,
                           "no lock " + to_string(lock_id) + " on this item");
  auto now = caf::make_timestamp();
  if (auto err = release_lock(*lock, now))
    return err;
  touch(now);
  return caf::error{};
}

caf::error inventory_item::deduct_stock(const caf::uuid& lock_id) {
  auto* lock = lookup_lock(lock_id);
  if (lock == nullptr)
    return caf::make_error(ec::no_such_lock,
                           "no lock " + to_string(lock_id) + " on this item");
  if (!lock->is_active())
    return caf::make_error(ec::invalid_lock_state,
                           "lock " + to_string(lock_id) + " is already "
                             + to_string(lock->state));
  auto new_locked = row_.locked.sub(lock->amount);
  if (!new_locked)
    return std::move(new_locked.error());
  if (auto err = lock->consume())
    return err;
  row_.locked = *new_locked;
  touch(caf::make_timestamp());
  return caf::error{};
}

caf::error inventory_item::increase_stock(
  quantity amount, decimal incoming_unit_cost, std::string_view note,
  const std::optional<batch_info>& batch) {
  if (amount.is_zero())
    return caf::make_error(ec::invalid_argument, "quantity must be positive");
  if (incoming_unit_cost.is_negative())
    return caf::make_error(ec::invalid_argument,
                           "unit cost cannot be negative");
  if (batch && batch->batch_number.empty())
    return caf::make_error(ec::invalid_argument, "batch number is required");
  auto new_available = row_.available.add(amount);
  if (!new_available)
    return std::move(new_available.error());
  // New cost = (old total * old cost + amount * incoming cost)
  //            / (old total + amount)
  auto old_total = row_.available.add(row_.locked);
  if (!old_total)
    return std::move(old_total.error());
  auto new_cost = incoming_unit_cost;
  if (!old_total->is_zero()) {
    auto old_value = old_total->value().mul(row_.unit_cost);
    if (!old_value)
      return std::move(old_value.error());
    auto incoming_value = amount.value().mul(incoming_unit_cost);
    if (!incoming_value)
      return std::move(incoming_value.error());
    auto combined_value = old_value->add(*incoming_value);
    if (!combined_value)
      return std::move(combined_value.error());
    auto new_total = old_total->add(amount);
    if (!new_total)
      return std::move(new_total.error());
    auto avg = combined_value->div(new_total->value());
    if (!avg)
      return std::move(avg.error());
    new_cost = *avg;
  }
  log::debug("increase item {} by {} at {}: {}", to_string(row_.id),
             to_string(amount), to_string(incoming_unit_cost), note);
  auto now = caf::make_timestamp();
  row_.available = *new_available;
  row_.unit_cost = new_cost;
  if (batch) {
    stock_batch entry;
    entry.id = caf::uuid::random();
    entry.inventory_item_id = row_.id;
    entry.batch_number = batch->batch_number;
    entry.production_date = batch->production_date;
    entry.expiry_date = batch->expiry_date;
    entry.amount = amount;
    entry.unit_cost = incoming_unit_cost;
    entry.created_at = now;
    batches_.push_back(std::move(entry));
  }
  touch(now);
  return caf::error{};
}

caf::error inventory_item::decrease_stock(quantity amount,
                                          std::string_view source_type,
                                          std::string_view source_id,
                                          std::string_view reason) {
  if (amount.is_zero())
    return caf::make_error(ec::invalid_argument, "quantity must be positive");
  if (!can_fulfill(amount))
    return caf::make_error(ec::insufficient_stock,
                           "cannot decrease by " + to_string(amount) + " of "
                             + to_string(row_.available) + " available");
  if (source_type.empty() || source_id.empty())
    return caf::make_error(ec::invalid_argument,
                           "source type and ID are required");
  auto new_available = row_.available.sub(amount);
  if (!new_available)
    return std::move(new_available.error());
  log::debug("decrease item {} by {} for {}/{}: {}", to_string(row_.id),
             to_string(amount), source_type, source_id, reason);
  row_.available = *new_available;
  touch(caf::make_timestamp());
  return caf::error{};
}

caf::error inventory_item::adjust_stock(quantity actual,
                                        std::string_view reason) {
  if (reason.empty())
    return caf::make_error(ec::invalid_argument,
                           "adjustment reason is required");
  if (!row_.locked.is_zero())
    return caf::make_error(ec::has_locked_stock,
                           "cannot adjust item " + to_string(row_.id)
                             + " while " + to_string(row_.locked)
                             + " is locked");
  log::debug("adjust item {} from {} to {}: {}", to_string(row_.id),
             to_string(row_.available), to_string(actual), reason);
  row_.available = actual;
  touch(caf::make_timestamp());
  return caf::error{};
}

caf::error inventory_item::set_thresholds(quantity min_qty, quantity max_qty) {
  if (!max_qty.is_zero() && max_qty < min_qty)
    return caf::make_error(ec::invalid_argument,
                           "maximum quantity must not be below the minimum");
  row_.min_quantity = min_qty;
  row_.max_quantity = max_qty;
  touch(caf::make_timestamp());
  return caf::error{};
}

std::vector<stock_lock>
inventory_item::get_expired_locks(caf::timestamp now) const {
  std::vector<stock_lock> result;
  std::copy_if(locks_.begin(), locks_.end(), std::back_inserter(result),
               [now](const auto& x) { return x.is_expired_at(now); });
  return result;
}

size_t inventory_item::release_expired_locks(caf::timestamp now) {
  size_t count = 0;
  for (auto& lock : locks_) {
    if (!lock.is_expired_at(now))
      continue;
    if (auto err = release_lock(lock, now)) {
      log::error("failed to release expired lock {}: {}", to_string(lock.id),
                 to_string(err));
      continue;
    }
    ++count;
  }
  if (count > 0)
    touch(now);
  return count;
}

stock_lock* inventory_item::lookup_lock(const caf::uuid& lock_id) {
  auto i = std::find_if(locks_.begin(), locks_.end(),
                        [&lock_id](const auto& x) { return x.id == lock_id; });
  return i != locks_.end() ? &*i : nullptr;
}

caf::error inventory_item::release_lock(stock_lock& lock, caf::timestamp now) {
  if (!lock.is_active())
    return caf::make_error(ec::invalid_lock_state,
                           "lock " + to_string(lock.id) + " is already "
                             + to_string(lock.state));
  auto new_locked = row_.locked.sub(lock.amount);
  if (!new_locked)
    return std::move(new_locked.error());
  auto new_available = row_.available.add(lock.amount);
  if (!new_available)
    return std::move(new_available.error());
  if (auto err = lock.release(now))
    return err;
  row_.locked = *new_locked;
  row_.available = *new_available;
  return caf::error{};
}

void inventory_item::touch(caf::timestamp now) {
  row_.updated_at = now;
  ++row_.version;
}

} // namespace stockpile
