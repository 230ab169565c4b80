// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/decimal.hpp"
#include "stockpile/inventory_item.hpp"
#include "stockpile/stock_batch.hpp"

#include <caf/json_object.hpp>
#include <caf/uuid.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace stockpile {

// Field accessors for JSON request payloads. Each returns `std::nullopt` if
// the field is missing or malformed.

/// Parses `text` as a JSON object.
std::optional<caf::json_object> parse_object(std::string_view text);

/// Reads a UUID from a string field.
std::optional<caf::uuid> get_uuid(const caf::json_object& obj,
                                  std::string_view key);

/// Reads a non-empty string field.
std::optional<std::string> get_string(const caf::json_object& obj,
                                      std::string_view key);

/// Accepts strings such as "12.5" as well as plain integers. Rejects integers
/// outside of the range of `decimal`.
std::optional<decimal> get_decimal(const caf::json_object& obj,
                                   std::string_view key);

/// Like `get_decimal`, but also rejects negative values.
std::optional<quantity> get_quantity(const caf::json_object& obj,
                                     std::string_view key);

/// Reads the fields tenant-id, warehouse-id and product-id.
std::optional<item_key> get_key(const caf::json_object& obj);

/// Result of reading the optional batch fields of a payload.
struct batch_field {
  /// Set if the payload is well-formed.
  bool valid = true;

  /// Set if the payload names a batch.
  std::optional<batch_info> batch;
};

/// Reads the fields batch-number and, optionally, production-date and
/// expiry-date as seconds since the epoch. A payload without batch-number
/// has no batch.
batch_field get_batch(const caf::json_object& obj);

} // namespace stockpile
