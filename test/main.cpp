// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/ec.hpp"
#include "stockpile/inventory_item.hpp"
#include "stockpile/stock_batch.hpp"
#include "stockpile/stock_lock.hpp"
#include "stockpile/types.hpp"

#include <caf/init_global_meta_objects.hpp>

#include <gtest/gtest.h>

int main(int argc, char** argv) {
  caf::init_global_meta_objects<caf::id_block::stockpile>();
  caf::core::init_global_meta_objects();
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
