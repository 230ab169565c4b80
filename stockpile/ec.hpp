// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/types.hpp"

#include <caf/default_enum_inspect.hpp>
#include <caf/is_error_code_enum.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace stockpile {

/// Application-specific error codes.
enum class ec : uint8_t {
  /// No error occurred.
  nil = 0,
  /// Indicates that a request exceeds the available quantity of an item.
  insufficient_stock,
  /// Indicates that another writer already advanced the version of an item.
  optimistic_lock_conflict,
  /// Indicates that no inventory item matches the query.
  no_such_item,
  /// Indicates that no stock lock matches the query.
  no_such_lock,
  /// Indicates that a stock lock was already released or consumed.
  invalid_lock_state,
  /// Indicates that an operation requires an item without outstanding locks.
  has_locked_stock,
  /// Indicates that a user-provided argument is invalid.
  invalid_argument,
  /// Indicates that a key already exists in the database.
  key_already_exists,
  /// Indicates that the database is not accessible.
  database_inaccessible,
  /// Indicates that a transaction ran past its deadline and was rolled back.
  deadline_exceeded,
  /// The number of error codes (must be last entry!).
  /// @note This value is not a valid error code.
  num_ec_codes,
};

/// @relates ec
std::string to_string(ec);

/// @relates ec
bool from_string(std::string_view, ec&);

/// @relates ec
bool from_integer(uint8_t, ec&);

/// @relates ec
template <class Inspector>
bool inspect(Inspector& f, ec& x) {
  return caf::default_enum_inspect(f, x);
}

} // namespace stockpile

CAF_ERROR_CODE_ENUM(stockpile::ec)
