// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/http_server.hpp"

#include "stockpile/payload.hpp"

#include <caf/json_object.hpp>
#include <caf/json_value.hpp>
#include <caf/net/actor_shell.hpp>
#include <caf/uuid.hpp>

#include <chrono>
#include <cstdint>
#include <optional>

using namespace std::literals;

using http_status = caf::net::http::status;

namespace stockpile {

namespace {

std::optional<caf::json_object> parse_payload(http_server::responder& res) {
  auto payload = res.payload();
  if (!caf::is_valid_utf8(payload))
    return std::nullopt;
  return parse_object(caf::to_string_view(payload));
}

} // namespace

http_status http_status_for(const caf::error& reason) {
  if (reason.category() != caf::type_id_v<ec>)
    return http_status::internal_server_error;
  switch (static_cast<ec>(reason.code())) {
    case ec::invalid_argument:
      return http_status::bad_request;
    case ec::no_such_item:
    case ec::no_such_lock:
      return http_status::not_found;
    case ec::insufficient_stock:
    case ec::invalid_lock_state:
    case ec::has_locked_stock:
    case ec::optimistic_lock_conflict:
      return http_status::conflict;
    default:
      return http_status::internal_server_error;
  }
}

void http_server::query(responder& res) {
  auto obj = parse_payload(res);
  if (!obj) {
    respond_with_invalid_payload(res);
    return;
  }
  auto key = get_key(*obj);
  if (!key) {
    respond_with_invalid_payload(res);
    return;
  }
  auto* self = res.self();
  auto prom = std::move(res).to_promise();
  self->request(inventory_, timeout_, caf::get_atom_v, *key)
    .then(
      [this, prom](const inventory_item& value) mutable {
        respond_with_json(prom, http_status::ok, value);
      },
      [this, prom](const caf::error& what) mutable {
        respond_with_error(prom, what);
      });
}

void http_server::lock(responder& res) {
  auto obj = parse_payload(res);
  if (!obj) {
    respond_with_invalid_payload(res);
    return;
  }
  auto key = get_key(*obj);
  auto amount = get_quantity(*obj, "quantity");
  auto source_type = get_string(*obj, "source-type");
  auto source_id = get_string(*obj, "source-id");
  if (!key || !amount || !source_type || !source_id) {
    respond_with_invalid_payload(res);
    return;
  }
  // A zero timestamp selects the default expiry of the service.
  auto expire_at = caf::timestamp{};
  if (auto secs = obj->value("expire-in-seconds"); secs.is_integer()) {
    if (secs.to_integer() <= 0) {
      respond_with_invalid_payload(res);
      return;
    }
    expire_at = caf::make_timestamp() + std::chrono::seconds{secs.to_integer()};
  }
  auto* self = res.self();
  auto prom = std::move(res).to_promise();
  self
    ->request(inventory_, timeout_, lock_atom_v, *key, *amount,
              std::move(*source_type), std::move(*source_id), expire_at)
    .then(
      [this, prom](const stock_lock& value) mutable {
        respond_with_json(prom, http_status::created, value);
      },
      [this, prom](const caf::error& what) mutable {
        respond_with_error(prom, what);
      });
}

void http_server::unlock(responder& res) {
  auto obj = parse_payload(res);
  if (!obj) {
    respond_with_invalid_payload(res);
    return;
  }
  auto tenant_id = get_uuid(*obj, "tenant-id");
  auto lock_id = get_uuid(*obj, "lock-id");
  if (!tenant_id || !lock_id) {
    respond_with_invalid_payload(res);
    return;
  }
  auto* self = res.self();
  auto prom = std::move(res).to_promise();
  self->request(inventory_, timeout_, unlock_atom_v, *tenant_id, *lock_id)
    .then([prom]() mutable { prom.respond(http_status::no_content); },
          [this, prom](const caf::error& what) mutable {
            respond_with_error(prom, what);
          });
}

void http_server::deduct(responder& res) {
  auto obj = parse_payload(res);
  if (!obj) {
    respond_with_invalid_payload(res);
    return;
  }
  auto tenant_id = get_uuid(*obj, "tenant-id");
  auto lock_id = get_uuid(*obj, "lock-id");
  if (!tenant_id || !lock_id) {
    respond_with_invalid_payload(res);
    return;
  }
  auto* self = res.self();
  auto prom = std::move(res).to_promise();
  self->request(inventory_, timeout_, deduct_atom_v, *tenant_id, *lock_id)
    .then([prom]() mutable { prom.respond(http_status::no_content); },
          [this, prom](const caf::error& what) mutable {
            respond_with_error(prom, what);
          });
}

void http_server::increase(responder& res) {
  auto obj = parse_payload(res);
  if (!obj) {
    respond_with_invalid_payload(res);
    return;
  }
  auto key = get_key(*obj);
  auto amount = get_quantity(*obj, "quantity");
  auto unit_cost = get_decimal(*obj, "unit-cost");
  auto source_type = get_string(*obj, "source-type");
  auto source_id = get_string(*obj, "source-id");
  auto batch = get_batch(*obj);
  if (!key || !amount || !unit_cost || !source_type || !source_id
      || !batch.valid) {
    respond_with_invalid_payload(res);
    return;
  }
  auto* self = res.self();
  auto prom = std::move(res).to_promise();
  auto on_value = [this, prom](const inventory_item& value) mutable {
    respond_with_json(prom, http_status::ok, value);
  };
  auto on_error = [this, prom](const caf::error& what) mutable {
    respond_with_error(prom, what);
  };
  if (batch.batch) {
    self
      ->request(inventory_, timeout_, increase_atom_v, *key, *amount,
                *unit_cost, std::move(*source_type), std::move(*source_id),
                std::move(*batch.batch))
      .then(std::move(on_value), std::move(on_error));
    return;
  }
  self
    ->request(inventory_, timeout_, increase_atom_v, *key, *amount, *unit_cost,
              std::move(*source_type), std::move(*source_id))
    .then(std::move(on_value), std::move(on_error));
}

void http_server::decrease(responder& res) {
  auto obj = parse_payload(res);
  if (!obj) {
    respond_with_invalid_payload(res);
    return;
  }
  auto key = get_key(*obj);
  auto amount = get_quantity(*obj, "quantity");
  auto source_type = get_string(*obj, "source-type");
  auto source_id = get_string(*obj, "source-id");
  auto reason = get_string(*obj, "reason");
  if (!key || !amount || !source_type || !source_id || !reason) {
    respond_with_invalid_payload(res);
    return;
  }
  auto* self = res.self();
  auto prom = std::move(res).to_promise();
  self
    ->request(inventory_, timeout_, decrease_atom_v, *key, *amount,
              std::move(*source_type), std::move(*source_id),
              std::move(*reason))
    .then(
      [this, prom](const inventory_item& value) mutable {
        respond_with_json(prom, http_status::ok, value);
      },
      [this, prom](const caf::error& what) mutable {
        respond_with_error(prom, what);
      });
}

void http_server::adjust(responder& res) {
  auto obj = parse_payload(res);
  if (!obj) {
    respond_with_invalid_payload(res);
    return;
  }
  auto key = get_key(*obj);
  auto actual = get_quantity(*obj, "quantity");
  auto reason = get_string(*obj, "reason");
  if (!key || !actual || !reason) {
    respond_with_invalid_payload(res);
    return;
  }
  auto* self = res.self();
  auto prom = std::move(res).to_promise();
  self
    ->request(inventory_, timeout_, adjust_atom_v, *key, *actual,
              std::move(*reason))
    .then(
      [this, prom](const inventory_item& value) mutable {
        respond_with_json(prom, http_status::ok, value);
      },
      [this, prom](const caf::error& what) mutable {
        respond_with_error(prom, what);
      });
}

void http_server::release_source(responder& res) {
  auto obj = parse_payload(res);
  if (!obj) {
    respond_with_invalid_payload(res);
    return;
  }
  auto tenant_id = get_uuid(*obj, "tenant-id");
  auto source_type = get_string(*obj, "source-type");
  auto source_id = get_string(*obj, "source-id");
  if (!tenant_id || !source_type || !source_id) {
    respond_with_invalid_payload(res);
    return;
  }
  auto* self = res.self();
  auto prom = std::move(res).to_promise();
  self
    ->request(inventory_, timeout_, release_source_atom_v, *tenant_id,
              std::move(*source_type), std::move(*source_id))
    .then(
      [prom](uint64_t count) mutable {
        auto body = R"_({"released": )_" + std::to_string(count) + "}";
        prom.respond(http_status::ok, json_mime_type, body);
      },
      [this, prom](const caf::error& what) mutable {
        respond_with_error(prom, what);
      });
}

} // namespace stockpile
