// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/database.hpp"
#include "stockpile/decimal.hpp"
#include "stockpile/inventory_item.hpp"

#include <caf/uuid.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace stockpile::test {

/// Shortcut for quantities in test code. Only valid for non-negative input.
inline quantity qty(std::string_view str) {
  return *quantity::parse(str);
}

/// @copydoc qty
inline quantity qty(int64_t value) {
  return *quantity::make(*decimal::from_integer(value));
}

/// Shortcut for decimals in test code.
inline decimal dec(std::string_view str) {
  return *decimal::parse(str);
}

inline item_key make_key() {
  return item_key{caf::uuid::random(), caf::uuid::random(),
                  caf::uuid::random()};
}

/// Runs each test against a fresh database file.
class database_fixture : public ::testing::Test {
protected:
  void SetUp() override {
    auto name = "stockpile-test-" + to_string(caf::uuid::random()) + ".db";
    db_file = (std::filesystem::temp_directory_path() / name).string();
    db = connect();
    ASSERT_NE(db, nullptr);
  }

  void TearDown() override {
    db.reset();
    std::error_code err;
    for (auto suffix : {"", "-wal", "-shm"})
      std::filesystem::remove(db_file + suffix, err);
  }

  /// Opens another connection to the database file of this test.
  database_ptr connect() {
    auto result = std::make_shared<database>(db_file);
    if (auto err = result->open()) {
      ADD_FAILURE() << "failed to open " << db_file << ": " << to_string(err);
      return nullptr;
    }
    return result;
  }

  /// Returns the number of rows in `table` or -1 on error.
  int64_t row_count(std::string_view table) {
    auto result = db->count(table);
    if (!result) {
      ADD_FAILURE() << "failed to count rows: " << to_string(result.error());
      return -1;
    }
    return *result;
  }

  std::string db_file;
  database_ptr db;
};

} // namespace stockpile::test
