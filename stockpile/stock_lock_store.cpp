// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/stock_lock_store.hpp"

#include "stockpile/ec.hpp"
#include "stockpile/log.hpp"

#include <sqlite3.h>

namespace stockpile {

namespace {

#define LOCK_COLUMNS                                                           \
  "id, inventory_item_id, quantity, source_type, source_id, expire_at, "       \
  "released, consumed, released_at, created_at"

constexpr std::string_view select_by_id_sql
  = "SELECT " LOCK_COLUMNS " FROM stock_locks WHERE id = ?";

constexpr std::string_view select_active_sql
  = "SELECT " LOCK_COLUMNS " FROM stock_locks "
    "WHERE inventory_item_id = ? AND released = 0 AND consumed = 0 "
    "ORDER BY created_at";

constexpr std::string_view select_by_source_sql
  = "SELECT " LOCK_COLUMNS " FROM stock_locks "
    "WHERE source_type = ? AND source_id = ? "
    "AND released = 0 AND consumed = 0 ORDER BY created_at";

constexpr std::string_view select_expired_sql
  = "SELECT " LOCK_COLUMNS " FROM stock_locks "
    "WHERE expire_at < ? AND released = 0 AND consumed = 0 "
    "ORDER BY expire_at";

constexpr std::string_view upsert_sql
  = "INSERT INTO stock_locks (" LOCK_COLUMNS ") "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT (id) DO UPDATE SET "
    "released = excluded.released, "
    "consumed = excluded.consumed, "
    "released_at = excluded.released_at";

// Restores the quantity of all expired locks to their items. Must run before
// marking the locks as released.
constexpr std::string_view restore_expired_sql
  = "UPDATE inventory_items SET "
    "available_quantity = available_quantity + expired.total, "
    "locked_quantity = locked_quantity - expired.total, "
    "version = version + 1, "
    "updated_at = ?1 "
    "FROM (SELECT inventory_item_id, SUM(quantity) AS total "
    "      FROM stock_locks "
    "      WHERE expire_at < ?1 AND released = 0 AND consumed = 0 "
    "      GROUP BY inventory_item_id) AS expired "
    "WHERE inventory_items.id = expired.inventory_item_id";

constexpr std::string_view release_expired_sql
  = "UPDATE stock_locks SET released = 1, released_at = ?1 "
    "WHERE expire_at < ?1 AND released = 0 AND consumed = 0";

#undef LOCK_COLUMNS

lock_state to_lock_state(int64_t released, int64_t consumed) {
  if (consumed != 0)
    return lock_state::consumed;
  if (released != 0)
    return lock_state::released;
  return lock_state::active;
}

caf::expected<stock_lock> read_lock(const statement& stmt) {
  stock_lock result;
  result.id = stmt.column_uuid(0);
  result.inventory_item_id = stmt.column_uuid(1);
  auto amount = stmt.column_quantity(2);
  if (!amount)
    return caf::make_error(ec::database_inaccessible,
                           "negative quantity in lock " + to_string(result.id));
  result.amount = *amount;
  result.source_type = stmt.column_text(3);
  result.source_id = stmt.column_text(4);
  result.expire_at = stmt.column_timestamp(5);
  result.state = to_lock_state(stmt.column_int64(6), stmt.column_int64(7));
  result.released_at = stmt.column_optional_timestamp(8);
  result.created_at = stmt.column_timestamp(9);
  return result;
}

} // namespace

caf::expected<stock_lock> stock_lock_store::find_by_id(const caf::uuid& id) {
  auto stmt = db_->prepare(select_by_id_sql, id);
  if (!stmt)
    return std::move(stmt.error());
  switch (auto res = stmt->step()) {
    case SQLITE_ROW:
      return read_lock(*stmt);
    case SQLITE_DONE:
      return caf::make_error(ec::no_such_lock, "no lock " + to_string(id));
    default:
      return db_->make_error(res, "find lock");
  }
}

caf::expected<std::vector<stock_lock>>
stock_lock_store::find_active(const caf::uuid& inventory_item_id) {
  auto stmt = db_->prepare(select_active_sql, inventory_item_id);
  if (!stmt)
    return std::move(stmt.error());
  return fetch_all(*stmt);
}

caf::expected<std::vector<stock_lock>>
stock_lock_store::find_by_source(std::string_view source_type,
                                 std::string_view source_id) {
  auto stmt = db_->prepare(select_by_source_sql, source_type, source_id);
  if (!stmt)
    return std::move(stmt.error());
  return fetch_all(*stmt);
}

caf::expected<std::vector<stock_lock>>
stock_lock_store::find_expired(caf::timestamp now) {
  auto stmt = db_->prepare(select_expired_sql, now);
  if (!stmt)
    return std::move(stmt.error());
  return fetch_all(*stmt);
}

caf::error stock_lock_store::save(const stock_lock& lock) {
  auto released = int64_t{lock.state == lock_state::released ? 1 : 0};
  auto consumed = int64_t{lock.state == lock_state::consumed ? 1 : 0};
  auto stmt = db_->prepare(upsert_sql, lock.id, lock.inventory_item_id,
                           lock.amount, lock.source_type, lock.source_id,
                           lock.expire_at, released, consumed,
                           lock.released_at, lock.created_at);
  if (!stmt)
    return std::move(stmt.error());
  if (auto res = stmt->step(); res != SQLITE_DONE)
    return db_->make_error(res, "save lock");
  return caf::error{};
}

caf::expected<size_t> stock_lock_store::release_expired(caf::timestamp now) {
  // A savepoint nests inside a transaction_scope and acts as a transaction of
  // its own otherwise.
  if (auto err = db_->exec("SAVEPOINT release_expired"))
    return err;
  auto result = release_expired_impl(now);
  if (!result) {
    if (auto err = db_->exec("ROLLBACK TO release_expired; "
                             "RELEASE release_expired"))
      log::error("failed to roll back the sweep: {}", to_string(err));
    return result;
  }
  if (auto err = db_->exec("RELEASE release_expired"))
    return err;
  if (*result > 0)
    log::info("released {} expired stock locks", *result);
  return result;
}

caf::expected<std::vector<stock_lock>>
stock_lock_store::fetch_all(statement& stmt) {
  std::vector<stock_lock> result;
  auto res = stmt.step();
  for (; res == SQLITE_ROW; res = stmt.step()) {
    auto lock = read_lock(stmt);
    if (!lock)
      return std::move(lock.error());
    result.push_back(std::move(*lock));
  }
  if (res != SQLITE_DONE)
    return db_->make_error(res, "find locks");
  return result;
}

caf::expected<size_t>
stock_lock_store::release_expired_impl(caf::timestamp now) {
  auto restore = db_->prepare(restore_expired_sql, now);
  if (!restore)
    return std::move(restore.error());
  if (auto res = restore->step(); res != SQLITE_DONE)
    return db_->make_error(res, "restore expired quantities");
  auto release = db_->prepare(release_expired_sql, now);
  if (!release)
    return std::move(release.error());
  if (auto res = release->step(); res != SQLITE_DONE)
    return db_->make_error(res, "release expired locks");
  return static_cast<size_t>(db_->changes());
}

} // namespace stockpile
