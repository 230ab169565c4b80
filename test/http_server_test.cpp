// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/http_server.hpp"

#include "stockpile/ec.hpp"
#include "stockpile/payload.hpp"
#include "fixture.hpp"

#include <caf/json_object.hpp>
#include <caf/sec.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <string_view>

using namespace stockpile;
using stockpile::test::dec;
using stockpile::test::qty;

using http_status = caf::net::http::status;

namespace {

constexpr std::string_view tenant = "a9c7e8b2-4f1d-4c3b-9e6a-2d5f8b1c7e30";
constexpr std::string_view warehouse = "1b2c3d4e-5f60-4718-8293-a4b5c6d7e8f9";
constexpr std::string_view product = "0f1e2d3c-4b5a-4968-8776-655443322110";

caf::json_object parse(std::string_view text) {
  auto result = parse_object(text);
  EXPECT_TRUE(result) << text;
  return result ? *result : caf::json_object{};
}

std::string key_fields() {
  std::string result = R"_("tenant-id": ")_";
  result += tenant;
  result += R"_(", "warehouse-id": ")_";
  result += warehouse;
  result += R"_(", "product-id": ")_";
  result += product;
  result += '"';
  return result;
}

} // namespace

TEST(HttpStatusTest, MapsErrorCodes) {
  auto status_of = [](ec code) {
    return http_status_for(caf::make_error(code));
  };
  EXPECT_EQ(status_of(ec::invalid_argument), http_status::bad_request);
  EXPECT_EQ(status_of(ec::no_such_item), http_status::not_found);
  EXPECT_EQ(status_of(ec::no_such_lock), http_status::not_found);
  EXPECT_EQ(status_of(ec::insufficient_stock), http_status::conflict);
  EXPECT_EQ(status_of(ec::invalid_lock_state), http_status::conflict);
  EXPECT_EQ(status_of(ec::has_locked_stock), http_status::conflict);
  EXPECT_EQ(status_of(ec::optimistic_lock_conflict), http_status::conflict);
  EXPECT_EQ(status_of(ec::key_already_exists),
            http_status::internal_server_error);
  EXPECT_EQ(status_of(ec::database_inaccessible),
            http_status::internal_server_error);
  EXPECT_EQ(status_of(ec::deadline_exceeded),
            http_status::internal_server_error);
}

TEST(HttpStatusTest, MapsForeignErrorsToInternalServerError) {
  EXPECT_EQ(http_status_for(caf::make_error(caf::sec::request_timeout)),
            http_status::internal_server_error);
  EXPECT_EQ(http_status_for(caf::make_error(caf::sec::runtime_error)),
            http_status::internal_server_error);
}

TEST(PayloadTest, ParsesOnlyObjects) {
  EXPECT_TRUE(parse_object(R"_({"quantity": "1"})_"));
  EXPECT_FALSE(parse_object("[1, 2, 3]"));
  EXPECT_FALSE(parse_object(R"_("text")_"));
  EXPECT_FALSE(parse_object("{"));
  EXPECT_FALSE(parse_object(""));
}

TEST(PayloadTest, ReadsItemKey) {
  // Given a payload with all three IDs
  auto obj = parse("{" + key_fields() + "}");
  // When reading the key
  auto key = get_key(obj);
  // Then each ID matches its field
  ASSERT_TRUE(key);
  EXPECT_EQ(to_string(key->tenant_id), tenant);
  EXPECT_EQ(to_string(key->warehouse_id), warehouse);
  EXPECT_EQ(to_string(key->product_id), product);
}

TEST(PayloadTest, RejectsMissingOrMalformedIds) {
  // Given payloads with a missing ID, a non-string ID and a malformed ID
  auto missing = parse(R"_({"tenant-id": "a9c7e8b2-4f1d-4c3b-9e6a-2d5f8b1c7e30",
                            "warehouse-id": "1b2c3d4e-5f60-4718-8293-a4b5c6d7e8f9"})_");
  auto number = parse(R"_({"lock-id": 42})_");
  auto object = parse(R"_({"lock-id": {"id": "x"}})_");
  auto malformed = parse(R"_({"lock-id": "not-a-uuid"})_");
  // Then reading them fails
  EXPECT_FALSE(get_key(missing));
  EXPECT_FALSE(get_uuid(number, "lock-id"));
  EXPECT_FALSE(get_uuid(object, "lock-id"));
  EXPECT_FALSE(get_uuid(malformed, "lock-id"));
  EXPECT_FALSE(get_uuid(malformed, "tenant-id"));
}

TEST(PayloadTest, ReadsStrings) {
  auto obj = parse(R"_({"source-id": "O-1", "empty": "", "number": 7})_");
  auto source_id = get_string(obj, "source-id");
  ASSERT_TRUE(source_id);
  EXPECT_EQ(*source_id, "O-1");
  EXPECT_FALSE(get_string(obj, "empty"));
  EXPECT_FALSE(get_string(obj, "number"));
  EXPECT_FALSE(get_string(obj, "missing"));
}

TEST(PayloadTest, ReadsDecimalsFromStringsAndIntegers) {
  auto obj = parse(R"_({"a": "12.5", "b": 7, "c": -3, "d": "1.23456",
                        "e": 1.5, "f": true})_");
  auto a = get_decimal(obj, "a");
  ASSERT_TRUE(a);
  EXPECT_EQ(*a, dec("12.5"));
  auto b = get_decimal(obj, "b");
  ASSERT_TRUE(b);
  EXPECT_EQ(*b, dec("7"));
  auto c = get_decimal(obj, "c");
  ASSERT_TRUE(c);
  EXPECT_EQ(*c, dec("-3"));
  EXPECT_FALSE(get_decimal(obj, "d"));
  EXPECT_FALSE(get_decimal(obj, "e"));
  EXPECT_FALSE(get_decimal(obj, "f"));
  EXPECT_FALSE(get_decimal(obj, "missing"));
}

TEST(PayloadTest, RejectsIntegersOutOfRange) {
  // Given integers that fit into 64 bits but not into a decimal
  auto obj = parse(R"_({"quantity": 2000000000000000,
                        "unit-cost": -2000000000000000,
                        "limit": 922337203685477})_");
  // When reading them as decimals
  // Then the out-of-range values are rejected
  EXPECT_FALSE(get_decimal(obj, "quantity"));
  EXPECT_FALSE(get_quantity(obj, "quantity"));
  EXPECT_FALSE(get_decimal(obj, "unit-cost"));
  auto limit = get_decimal(obj, "limit");
  ASSERT_TRUE(limit);
  EXPECT_EQ(limit->units(), 9'223'372'036'854'770);
}

TEST(PayloadTest, RejectsNegativeQuantities) {
  auto obj = parse(R"_({"a": -1, "b": "-0.5", "c": "0", "d": 10})_");
  EXPECT_FALSE(get_quantity(obj, "a"));
  EXPECT_FALSE(get_quantity(obj, "b"));
  auto c = get_quantity(obj, "c");
  ASSERT_TRUE(c);
  EXPECT_TRUE(c->is_zero());
  auto d = get_quantity(obj, "d");
  ASSERT_TRUE(d);
  EXPECT_EQ(*d, qty(10));
}

TEST(PayloadTest, BatchFieldsAreOptional) {
  auto field = get_batch(parse("{" + key_fields() + "}"));
  EXPECT_TRUE(field.valid);
  EXPECT_FALSE(field.batch);
}

TEST(PayloadTest, ReadsBatchFields) {
  // Given a payload with a batch number and both dates
  auto field = get_batch(parse(R"_({"batch-number": "LOT-1",
                                    "production-date": 1700000000,
                                    "expiry-date": 1710000000})_"));
  // Then the batch carries all three values
  ASSERT_TRUE(field.valid);
  ASSERT_TRUE(field.batch);
  EXPECT_EQ(field.batch->batch_number, "LOT-1");
  ASSERT_TRUE(field.batch->production_date);
  EXPECT_EQ(field.batch->production_date->time_since_epoch(),
            std::chrono::seconds{1'700'000'000});
  ASSERT_TRUE(field.batch->expiry_date);
  EXPECT_EQ(field.batch->expiry_date->time_since_epoch(),
            std::chrono::seconds{1'710'000'000});
}

TEST(PayloadTest, RejectsMalformedBatchFields) {
  for (auto text : {R"_({"batch-number": ""})_",
                    R"_({"batch-number": 17})_",
                    R"_({"batch-number": "LOT-1", "expiry-date": -1})_",
                    R"_({"batch-number": "LOT-1", "expiry-date": "2024"})_",
                    R"_({"batch-number": "LOT-1", "production-date": 1.5})_",
                    R"_({"batch-number": "LOT-1",
                         "expiry-date": 9223372036854775807})_"}) {
    auto field = get_batch(parse(text));
    EXPECT_FALSE(field.valid) << text;
    EXPECT_FALSE(field.batch) << text;
  }
}
