// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include <caf/type_id.hpp>

#include <cstdint>

namespace stockpile {

class decimal;
class inventory_item;
class quantity;
enum class ec : uint8_t;
struct batch_info;
struct item_key;
struct stock_batch;
struct stock_lock;

} // namespace stockpile

CAF_BEGIN_TYPE_ID_BLOCK(stockpile, first_custom_type_id)

  CAF_ADD_TYPE_ID(stockpile, (stockpile::ec))
  CAF_ADD_TYPE_ID(stockpile, (stockpile::decimal))
  CAF_ADD_TYPE_ID(stockpile, (stockpile::quantity))
  CAF_ADD_TYPE_ID(stockpile, (stockpile::item_key))
  CAF_ADD_TYPE_ID(stockpile, (stockpile::stock_lock))
  CAF_ADD_TYPE_ID(stockpile, (stockpile::inventory_item))
  CAF_ADD_TYPE_ID(stockpile, (stockpile::batch_info))
  CAF_ADD_TYPE_ID(stockpile, (stockpile::stock_batch))

  // Reserves stock of an item for a source document.
  CAF_ADD_ATOM(stockpile, stockpile, lock_atom)

  // Returns the quantity of a lock to the available stock.
  CAF_ADD_ATOM(stockpile, stockpile, unlock_atom)

  // Ships the quantity of a lock.
  CAF_ADD_ATOM(stockpile, stockpile, deduct_atom)

  // Receives stock.
  CAF_ADD_ATOM(stockpile, stockpile, increase_atom)

  // Removes available stock without a prior lock.
  CAF_ADD_ATOM(stockpile, stockpile, decrease_atom)

  // Sets the available quantity after a physical count.
  CAF_ADD_ATOM(stockpile, stockpile, adjust_atom)

  // Unlocks all active locks of a source document.
  CAF_ADD_ATOM(stockpile, stockpile, release_source_atom)

  // Releases all expired locks.
  CAF_ADD_ATOM(stockpile, stockpile, sweep_atom)

CAF_END_TYPE_ID_BLOCK(stockpile)
