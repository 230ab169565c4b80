// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "stockpile/ec.hpp"
#include "stockpile/inventory_actor.hpp"

#include <caf/error.hpp>
#include <caf/json_writer.hpp>
#include <caf/net/http/responder.hpp>
#include <caf/net/http/status.hpp>
#include <caf/sec.hpp>
#include <caf/timespan.hpp>
#include <caf/type_id.hpp>

#include <string>
#include <string_view>

namespace stockpile {

/// Selects the HTTP status for an error returned by the inventory actor.
caf::net::http::status http_status_for(const caf::error& reason);

/// Bridges between HTTP requests and the inventory actor. All routes accept a
/// JSON object as payload. IDs and decimals travel as strings.
class http_server {
public:
  using responder = caf::net::http::responder;

  http_server(inventory_actor inventory, caf::timespan timeout)
    : inventory_(std::move(inventory)), timeout_(timeout) {
    writer_.skip_object_type_annotation(true);
  }

  static constexpr std::string_view json_mime_type = "application/json";

  /// Fields: tenant-id, warehouse-id, product-id.
  void query(responder& res);

  /// Fields: tenant-id, warehouse-id, product-id, quantity, source-type,
  /// source-id and optionally expire-in-seconds.
  void lock(responder& res);

  /// Fields: tenant-id, lock-id.
  void unlock(responder& res);

  /// Fields: tenant-id, lock-id.
  void deduct(responder& res);

  /// Fields: tenant-id, warehouse-id, product-id, quantity, unit-cost,
  /// source-type, source-id and optionally batch-number, production-date
  /// and expiry-date.
  void increase(responder& res);

  /// Fields: tenant-id, warehouse-id, product-id, quantity, source-type,
  /// source-id, reason.
  void decrease(responder& res);

  /// Fields: tenant-id, warehouse-id, product-id, quantity, reason.
  void adjust(responder& res);

  /// Fields: tenant-id, source-type, source-id.
  void release_source(responder& res);

private:
  template <class Responder, class T>
  void respond_with_json(Responder& prom, caf::net::http::status code,
                         const T& value) {
    writer_.reset();
    if (!writer_.apply(value)) {
      respond_with_error(prom, caf::net::http::status::internal_server_error,
                         "serialization_failed");
      return;
    }
    prom.respond(code, json_mime_type, writer_.str());
  }

  template <class Responder>
  void respond_with_error(Responder& prom, caf::net::http::status code,
                          std::string_view what) {
    std::string body = R"_({"code": ")_";
    body += what;
    body += "\"}";
    prom.respond(code, json_mime_type, body);
  }

  template <class Responder>
  void respond_with_error(Responder& prom, const caf::error& reason) {
    using namespace std::literals;
    auto code = http_status_for(reason);
    if (reason.category() == caf::type_id_v<ec>) {
      auto name = to_string(static_cast<ec>(reason.code()));
      respond_with_error(prom, code, name);
      return;
    }
    if (reason == caf::sec::request_timeout) {
      respond_with_error(prom, code, "timeout"sv);
      return;
    }
    respond_with_error(prom, code, "internal_error"sv);
  }

  template <class Responder>
  void respond_with_invalid_payload(Responder& res) {
    respond_with_error(res, caf::net::http::status::bad_request,
                       "invalid_payload");
  }

  inventory_actor inventory_;
  caf::timespan timeout_;
  caf::json_writer writer_;
};

} // namespace stockpile
