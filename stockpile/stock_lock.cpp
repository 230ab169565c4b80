// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/stock_lock.hpp"

#include "stockpile/ec.hpp"

namespace stockpile {

namespace {

constexpr std::string_view lock_state_names[] = {
  "active",
  "released",
  "consumed",
};

} // namespace

std::string to_string(lock_state x) {
  return std::string{lock_state_names[static_cast<uint8_t>(x)]};
}

bool from_string(std::string_view name, lock_state& x) {
  for (uint8_t i = 0; i < 3; ++i) {
    if (name == lock_state_names[i]) {
      x = static_cast<lock_state>(i);
      return true;
    }
  }
  return false;
}

bool from_integer(uint8_t value, lock_state& x) {
  if (value < 3) {
    x = static_cast<lock_state>(value);
    return true;
  }
  return false;
}

caf::error stock_lock::release(caf::timestamp now) {
  if (!is_active())
    return caf::make_error(ec::invalid_lock_state,
                           "lock " + to_string(id) + " is already "
                             + to_string(state));
  state = lock_state::released;
  released_at = now;
  return caf::error{};
}

caf::error stock_lock::consume() {
  if (!is_active())
    return caf::make_error(ec::invalid_lock_state,
                           "lock " + to_string(id) + " is already "
                             + to_string(state));
  state = lock_state::consumed;
  return caf::error{};
}

} // namespace stockpile
