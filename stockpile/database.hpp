// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/decimal.hpp"
#include "stockpile/ec.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/timestamp.hpp>
#include <caf/uuid.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

extern "C" {

struct sqlite3;
struct sqlite3_stmt;

} // extern "C"

namespace stockpile {

/// A prepared SQLite statement that finalizes itself on destruction.
class statement {
public:
  statement() = default;

  explicit statement(sqlite3_stmt* stmt) : stmt_(stmt) {
    // nop
  }

  statement(statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
  }

  statement& operator=(statement&& other) noexcept;

  statement(const statement&) = delete;

  statement& operator=(const statement&) = delete;

  ~statement();

  /// Binds a value to the parameter at `index` (1-based).
  /// @returns the SQLite result code.
  int bind(int index, int64_t value);

  /// @copydoc bind
  int bind(int index, std::string_view value);

  /// @copydoc bind
  int bind(int index, const caf::uuid& value);

  /// @copydoc bind
  int bind(int index, decimal value);

  /// @copydoc bind
  int bind(int index, quantity value);

  /// @copydoc bind
  int bind(int index, caf::timestamp value);

  /// @copydoc bind
  int bind(int index, const std::optional<caf::timestamp>& value);

  /// @copydoc bind
  int bind(int index, const std::optional<caf::uuid>& value);

  /// Binds `args` to the parameters 1 to N.
  /// @returns the first SQLite result code other than `SQLITE_OK`.
  template <class... Ts>
  int bind_all(const Ts&... args) {
    auto index = 0;
    auto res = 0; // SQLITE_OK
    ((res = res == 0 ? bind(++index, args) : res), ...);
    return res;
  }

  /// Evaluates the statement once.
  /// @returns `SQLITE_ROW`, `SQLITE_DONE` or an error code.
  int step();

  bool is_null(int col) const;

  int64_t column_int64(int col) const;

  std::string column_text(int col) const;

  /// @returns a nil UUID if the column holds no valid UUID.
  caf::uuid column_uuid(int col) const;

  decimal column_decimal(int col) const;

  /// @returns `ec::invalid_argument` if the column holds a negative value.
  caf::expected<quantity> column_quantity(int col) const;

  caf::timestamp column_timestamp(int col) const;

  std::optional<caf::timestamp> column_optional_timestamp(int col) const;

  std::optional<caf::uuid> column_optional_uuid(int col) const;

private:
  sqlite3_stmt* stmt_ = nullptr;
};

/// A single SQLite connection holding the inventory tables. A connection
/// must only be used by one thread at a time.
class database {
public:
  database(std::string db_file) : db_file_(std::move(db_file)) {
    // nop
  }

  database(const database&) = delete;

  database& operator=(const database&) = delete;

  ~database();

  /// Opens the database file and creates the tables if they do not exist.
  /// @returns `caf::error{}` on success, an error code otherwise.
  [[nodiscard]] caf::error open();

  /// Compiles a single SQL statement.
  [[nodiscard]] caf::expected<statement> prepare(std::string_view sql);

  /// Compiles a single SQL statement and binds `args` to its parameters.
  template <class... Ts>
  [[nodiscard]] caf::expected<statement> prepare(std::string_view sql,
                                                 const Ts&... args) {
    auto stmt = prepare(sql);
    if (!stmt)
      return stmt;
    if (auto res = stmt->bind_all(args...); res != 0)
      return make_error(res, "bind");
    return stmt;
  }

  /// Runs one or more SQL statements without result rows.
  [[nodiscard]] caf::error exec(const char* sql);

  /// Retrieves the number of rows in `table`.
  [[nodiscard]] caf::expected<int64_t> count(std::string_view table);

  /// Returns the number of rows changed by the most recent statement.
  int64_t changes() const noexcept;

  /// Checks whether this connection currently runs an explicit transaction.
  bool in_transaction() const noexcept;

  /// Starts a write transaction, blocking until no other connection writes.
  [[nodiscard]] caf::error begin();

  [[nodiscard]] caf::error commit();

  [[nodiscard]] caf::error rollback();

  /// Interrupts all statements running past `deadline`. Passing
  /// `std::nullopt` removes the deadline.
  void set_deadline(std::optional<caf::timestamp> deadline) noexcept {
    deadline_ = deadline;
  }

  /// Converts a SQLite result code into an error.
  caf::error make_error(int code, std::string_view what) const;

  const std::string& file() const noexcept {
    return db_file_;
  }

private:
  static int on_progress(void* ptr);

  std::string db_file_;
  sqlite3* db_ = nullptr;
  std::optional<caf::timestamp> deadline_;
};

/// A smart pointer to a database connection.
using database_ptr = std::shared_ptr<database>;

} // namespace stockpile
