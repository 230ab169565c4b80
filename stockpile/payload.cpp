// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/payload.hpp"

#include <caf/json_value.hpp>

#include <chrono>
#include <cstdint>
#include <limits>

namespace stockpile {

namespace {

constexpr int64_t max_epoch_seconds
  = std::numeric_limits<int64_t>::max() / 1'000'000'000;

// Reads seconds since the epoch. Sets `valid` to false for malformed input.
std::optional<caf::timestamp>
get_epoch_seconds(const caf::json_object& obj, std::string_view key,
                  bool& valid) {
  auto val = obj.value(key);
  if (val.is_undefined())
    return std::nullopt;
  if (!val.is_integer() || val.to_integer() < 0
      || val.to_integer() > max_epoch_seconds) {
    valid = false;
    return std::nullopt;
  }
  return caf::timestamp{std::chrono::seconds{val.to_integer()}};
}

} // namespace

std::optional<caf::json_object> parse_object(std::string_view text) {
  auto maybe_jval = caf::json_value::parse(text);
  if (!maybe_jval || !maybe_jval->is_object())
    return std::nullopt;
  return maybe_jval->to_object();
}

std::optional<caf::uuid> get_uuid(const caf::json_object& obj,
                                  std::string_view key) {
  auto val = obj.value(key);
  if (!val.is_string())
    return std::nullopt;
  caf::uuid result;
  if (auto err = caf::parse(val.to_string(), result))
    return std::nullopt;
  return result;
}

std::optional<std::string> get_string(const caf::json_object& obj,
                                      std::string_view key) {
  auto val = obj.value(key);
  if (!val.is_string() || val.to_string().empty())
    return std::nullopt;
  return std::string{val.to_string()};
}

std::optional<decimal> get_decimal(const caf::json_object& obj,
                                   std::string_view key) {
  auto val = obj.value(key);
  if (val.is_integer()) {
    if (auto result = decimal::from_integer(val.to_integer()))
      return *result;
    return std::nullopt;
  }
  if (!val.is_string())
    return std::nullopt;
  if (auto result = decimal::parse(val.to_string()))
    return *result;
  return std::nullopt;
}

std::optional<quantity> get_quantity(const caf::json_object& obj,
                                     std::string_view key) {
  auto val = get_decimal(obj, key);
  if (!val)
    return std::nullopt;
  if (auto result = quantity::make(*val))
    return *result;
  return std::nullopt;
}

std::optional<item_key> get_key(const caf::json_object& obj) {
  auto tenant_id = get_uuid(obj, "tenant-id");
  auto warehouse_id = get_uuid(obj, "warehouse-id");
  auto product_id = get_uuid(obj, "product-id");
  if (!tenant_id || !warehouse_id || !product_id)
    return std::nullopt;
  return item_key{*tenant_id, *warehouse_id, *product_id};
}

batch_field get_batch(const caf::json_object& obj) {
  batch_field result;
  if (obj.value("batch-number").is_undefined())
    return result;
  auto number = get_string(obj, "batch-number");
  if (!number) {
    result.valid = false;
    return result;
  }
  batch_info batch;
  batch.batch_number = std::move(*number);
  batch.production_date = get_epoch_seconds(obj, "production-date",
                                            result.valid);
  batch.expiry_date = get_epoch_seconds(obj, "expiry-date", result.valid);
  if (result.valid)
    result.batch = std::move(batch);
  return result;
}

} // namespace stockpile
