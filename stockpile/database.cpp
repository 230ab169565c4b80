// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/database.hpp"

#include "stockpile/log.hpp"

#include <sqlite3.h>

namespace stockpile {

namespace {

constexpr int busy_timeout_ms = 5'000;

constexpr int progress_interval = 1'000;

constexpr const char* schema = R"_(
  CREATE TABLE IF NOT EXISTS inventory_items (
    id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    warehouse_id TEXT NOT NULL,
    product_id TEXT NOT NULL,
    available_quantity INTEGER NOT NULL DEFAULT 0
      CHECK (available_quantity >= 0),
    locked_quantity INTEGER NOT NULL DEFAULT 0
      CHECK (locked_quantity >= 0),
    unit_cost INTEGER NOT NULL DEFAULT 0,
    min_quantity INTEGER NOT NULL DEFAULT 0,
    max_quantity INTEGER NOT NULL DEFAULT 0,
    version INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
  );
  CREATE UNIQUE INDEX IF NOT EXISTS idx_inventory_item_warehouse_product
    ON inventory_items (tenant_id, warehouse_id, product_id);
  CREATE TABLE IF NOT EXISTS stock_locks (
    id TEXT PRIMARY KEY,
    inventory_item_id TEXT NOT NULL REFERENCES inventory_items (id),
    quantity INTEGER NOT NULL CHECK (quantity > 0),
    source_type TEXT NOT NULL,
    source_id TEXT NOT NULL,
    expire_at INTEGER NOT NULL,
    released INTEGER NOT NULL DEFAULT 0,
    consumed INTEGER NOT NULL DEFAULT 0,
    released_at INTEGER,
    created_at INTEGER NOT NULL,
    CHECK (NOT (released AND consumed))
  );
  CREATE INDEX IF NOT EXISTS idx_stock_locks_item
    ON stock_locks (inventory_item_id);
  CREATE INDEX IF NOT EXISTS idx_stock_locks_source
    ON stock_locks (source_type, source_id);
  CREATE INDEX IF NOT EXISTS idx_stock_locks_expire_at
    ON stock_locks (expire_at);
  CREATE TABLE IF NOT EXISTS stock_batches (
    id TEXT PRIMARY KEY,
    inventory_item_id TEXT NOT NULL REFERENCES inventory_items (id),
    batch_number TEXT NOT NULL CHECK (batch_number <> ''),
    production_date INTEGER,
    expiry_date INTEGER,
    quantity INTEGER NOT NULL CHECK (quantity > 0),
    unit_cost INTEGER NOT NULL,
    consumed INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL
  );
  CREATE INDEX IF NOT EXISTS idx_stock_batches_item
    ON stock_batches (inventory_item_id);
  CREATE INDEX IF NOT EXISTS idx_stock_batches_expiry_date
    ON stock_batches (expiry_date);
  CREATE TABLE IF NOT EXISTS inventory_transactions (
    id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    inventory_item_id TEXT NOT NULL REFERENCES inventory_items (id),
    warehouse_id TEXT NOT NULL,
    product_id TEXT NOT NULL,
    transaction_type TEXT NOT NULL,
    quantity INTEGER NOT NULL,
    unit_cost INTEGER NOT NULL,
    balance_before INTEGER NOT NULL,
    balance_after INTEGER NOT NULL,
    source_type TEXT NOT NULL,
    source_id TEXT NOT NULL,
    lock_id TEXT,
    reason TEXT NOT NULL DEFAULT '',
    created_at INTEGER NOT NULL
  );
  CREATE INDEX IF NOT EXISTS idx_inv_tx_item
    ON inventory_transactions (inventory_item_id);
  CREATE INDEX IF NOT EXISTS idx_inv_tx_source
    ON inventory_transactions (source_type, source_id);
)_";

} // namespace

// -- statement ----------------------------------------------------------------

statement& statement::operator=(statement&& other) noexcept {
  if (this != &other) {
    if (stmt_ != nullptr)
      sqlite3_finalize(stmt_);
    stmt_ = other.stmt_;
    other.stmt_ = nullptr;
  }
  return *this;
}

statement::~statement() {
  if (stmt_ != nullptr)
    sqlite3_finalize(stmt_);
}

int statement::bind(int index, int64_t value) {
  return sqlite3_bind_int64(stmt_, index, value);
}

int statement::bind(int index, std::string_view value) {
  return sqlite3_bind_text(stmt_, index, value.data(),
                           static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

int statement::bind(int index, const caf::uuid& value) {
  return bind(index, std::string_view{to_string(value)});
}

int statement::bind(int index, decimal value) {
  return bind(index, value.units());
}

int statement::bind(int index, quantity value) {
  return bind(index, value.value().units());
}

int statement::bind(int index, caf::timestamp value) {
  return bind(index, static_cast<int64_t>(value.time_since_epoch().count()));
}

int statement::bind(int index, const std::optional<caf::timestamp>& value) {
  if (!value)
    return sqlite3_bind_null(stmt_, index);
  return bind(index, *value);
}

int statement::bind(int index, const std::optional<caf::uuid>& value) {
  if (!value)
    return sqlite3_bind_null(stmt_, index);
  return bind(index, *value);
}

int statement::step() {
  return sqlite3_step(stmt_);
}

bool statement::is_null(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

int64_t statement::column_int64(int col) const {
  return sqlite3_column_int64(stmt_, col);
}

std::string statement::column_text(int col) const {
  auto* str = sqlite3_column_text(stmt_, col);
  if (str == nullptr)
    return {};
  return std::string{reinterpret_cast<const char*>(str)};
}

caf::uuid statement::column_uuid(int col) const {
  caf::uuid result;
  if (auto err = caf::parse(column_text(col), result))
    return caf::uuid{};
  return result;
}

decimal statement::column_decimal(int col) const {
  return decimal::from_units(column_int64(col));
}

caf::expected<quantity> statement::column_quantity(int col) const {
  return quantity::make(column_decimal(col));
}

caf::timestamp statement::column_timestamp(int col) const {
  return caf::timestamp{caf::timespan{column_int64(col)}};
}

std::optional<caf::timestamp>
statement::column_optional_timestamp(int col) const {
  if (is_null(col))
    return std::nullopt;
  return column_timestamp(col);
}

std::optional<caf::uuid> statement::column_optional_uuid(int col) const {
  if (is_null(col))
    return std::nullopt;
  return column_uuid(col);
}

// -- database -----------------------------------------------------------------

database::~database() {
  if (db_ != nullptr)
    sqlite3_close(db_);
}

caf::error database::open() {
  // Open the database file.
  auto flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
               | SQLITE_OPEN_NOMUTEX;
  if (auto res = sqlite3_open_v2(db_file_.c_str(), &db_, flags, nullptr);
      res != SQLITE_OK)
    return make_error(res, "could not open " + db_file_);
  sqlite3_extended_result_codes(db_, 1);
  sqlite3_busy_timeout(db_, busy_timeout_ms);
  sqlite3_progress_handler(db_, progress_interval, &database::on_progress,
                           this);
  // Concurrent connections to the same file queue up instead of failing.
  if (auto err = exec("PRAGMA journal_mode = WAL; PRAGMA foreign_keys = ON;"))
    return err;
  // Create the tables if they do not exist.
  if (auto err = exec(schema))
    return err;
  log::debug("opened database {}", db_file_);
  return caf::error{};
}

caf::expected<statement> database::prepare(std::string_view sql) {
  sqlite3_stmt* stmt = nullptr;
  auto res = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()),
                                &stmt, nullptr);
  if (res != SQLITE_OK)
    return make_error(res, "prepare");
  return statement{stmt};
}

caf::error database::exec(const char* sql) {
  char* err_msg = nullptr;
  if (auto res = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
      res != SQLITE_OK) {
    auto msg = std::string{err_msg != nullptr ? err_msg : "exec"};
    sqlite3_free(err_msg);
    return make_error(res, msg);
  }
  return caf::error{};
}

caf::expected<int64_t> database::count(std::string_view table) {
  auto query = "SELECT COUNT(*) FROM " + std::string{table};
  auto stmt = prepare(query);
  if (!stmt)
    return std::move(stmt.error());
  if (auto res = stmt->step(); res != SQLITE_ROW)
    return make_error(res, "count");
  return stmt->column_int64(0);
}

int64_t database::changes() const noexcept {
  return sqlite3_changes64(db_);
}

bool database::in_transaction() const noexcept {
  return sqlite3_get_autocommit(db_) == 0;
}

caf::error database::begin() {
  return exec("BEGIN IMMEDIATE");
}

caf::error database::commit() {
  return exec("COMMIT");
}

caf::error database::rollback() {
  // SQLite may already have rolled back on its own, e.g., after an interrupt.
  if (!in_transaction())
    return caf::error{};
  return exec("ROLLBACK");
}

caf::error database::make_error(int code, std::string_view what) const {
  auto msg = std::string{what};
  if (db_ != nullptr) {
    msg += ": ";
    msg += sqlite3_errmsg(db_);
  }
  switch (code) {
    case SQLITE_INTERRUPT:
      return caf::make_error(ec::deadline_exceeded, std::move(msg));
    case SQLITE_CONSTRAINT_UNIQUE:
    case SQLITE_CONSTRAINT_PRIMARYKEY:
      return caf::make_error(ec::key_already_exists, std::move(msg));
    case SQLITE_CONSTRAINT_CHECK:
    case SQLITE_CONSTRAINT_FOREIGNKEY:
    case SQLITE_CONSTRAINT_NOTNULL:
      return caf::make_error(ec::invalid_argument, std::move(msg));
    default:
      log::error("database error {}: {}", code, msg);
      return caf::make_error(ec::database_inaccessible, std::move(msg));
  }
}

int database::on_progress(void* ptr) {
  auto* self = static_cast<database*>(ptr);
  if (self->deadline_ && caf::make_timestamp() >= *self->deadline_)
    return 1;
  return 0;
}

} // namespace stockpile
