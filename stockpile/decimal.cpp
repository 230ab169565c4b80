// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/decimal.hpp"

#include "stockpile/ec.hpp"

#include <caf/error.hpp>

#include <limits>

namespace stockpile {

namespace {

using wide_int = __int128;

// Divides `num` by `den` and rounds half away from zero.
wide_int round_div(wide_int num, wide_int den) {
  auto negative = (num < 0) != (den < 0);
  auto abs_num = num < 0 ? -num : num;
  auto abs_den = den < 0 ? -den : den;
  auto result = (abs_num + abs_den / 2) / abs_den;
  return negative ? -result : result;
}

bool fits_int64(wide_int x) {
  return x >= std::numeric_limits<int64_t>::min()
         && x <= std::numeric_limits<int64_t>::max();
}

} // namespace

caf::expected<decimal> decimal::parse(std::string_view str) {
  auto invalid = [str] {
    return caf::make_error(ec::invalid_argument,
                           "invalid decimal: " + std::string{str});
  };
  if (str.empty())
    return invalid();
  auto negative = false;
  if (str.front() == '-' || str.front() == '+') {
    negative = str.front() == '-';
    str.remove_prefix(1);
  }
  wide_int units = 0;
  auto int_digits = 0;
  auto frac_digits = 0;
  auto in_fraction = false;
  for (auto ch : str) {
    if (ch == '.') {
      if (in_fraction)
        return invalid();
      in_fraction = true;
      continue;
    }
    if (ch < '0' || ch > '9')
      return invalid();
    if (in_fraction) {
      if (++frac_digits > digits)
        return invalid();
    } else {
      ++int_digits;
    }
    units = units * 10 + (ch - '0');
    if (units > std::numeric_limits<int64_t>::max())
      return invalid();
  }
  if (int_digits + frac_digits == 0)
    return invalid();
  for (auto i = frac_digits; i < digits; ++i)
    units *= 10;
  if (negative)
    units = -units;
  if (!fits_int64(units))
    return invalid();
  return decimal{static_cast<int64_t>(units)};
}

caf::expected<decimal> decimal::from_integer(int64_t value) {
  int64_t units = 0;
  if (__builtin_mul_overflow(value, scale, &units))
    return caf::make_error(ec::invalid_argument,
                           "decimal overflow: " + std::to_string(value));
  return decimal{units};
}

caf::expected<decimal> decimal::add(decimal other) const {
  int64_t sum = 0;
  if (__builtin_add_overflow(units_, other.units_, &sum))
    return caf::make_error(ec::invalid_argument, "decimal overflow");
  return decimal{sum};
}

caf::expected<decimal> decimal::mul(decimal other) const {
  auto product = static_cast<wide_int>(units_) * other.units_;
  auto result = round_div(product, scale);
  if (!fits_int64(result))
    return caf::make_error(ec::invalid_argument, "decimal overflow");
  return decimal{static_cast<int64_t>(result)};
}

caf::expected<decimal> decimal::div(decimal other) const {
  if (other.is_zero())
    return caf::make_error(ec::invalid_argument, "division by zero");
  auto result = round_div(static_cast<wide_int>(units_) * scale, other.units_);
  if (!fits_int64(result))
    return caf::make_error(ec::invalid_argument, "decimal overflow");
  return decimal{static_cast<int64_t>(result)};
}

std::string to_string(decimal x) {
  auto units = static_cast<wide_int>(x.units());
  std::string result;
  if (units < 0) {
    result += '-';
    units = -units;
  }
  auto whole = static_cast<uint64_t>(units / decimal::scale);
  auto frac = static_cast<uint64_t>(units % decimal::scale);
  result += std::to_string(whole);
  if (frac != 0) {
    auto frac_str = std::to_string(frac);
    frac_str.insert(0, decimal::digits - frac_str.size(), '0');
    while (frac_str.back() == '0')
      frac_str.pop_back();
    result += '.';
    result += frac_str;
  }
  return result;
}

caf::expected<quantity> quantity::make(decimal value) {
  if (value.is_negative())
    return caf::make_error(ec::invalid_argument,
                           "quantity cannot be negative: " + to_string(value));
  return quantity{value};
}

caf::expected<quantity> quantity::parse(std::string_view str) {
  if (auto val = decimal::parse(str))
    return make(*val);
  else
    return std::move(val.error());
}

caf::expected<quantity> quantity::add(quantity other) const {
  int64_t sum = 0;
  if (__builtin_add_overflow(value_.units(), other.value_.units(), &sum))
    return caf::make_error(ec::invalid_argument, "quantity overflow");
  return quantity{decimal::from_units(sum)};
}

caf::expected<quantity> quantity::sub(quantity other) const {
  if (other.value_ > value_)
    return caf::make_error(ec::invalid_argument,
                           "quantity cannot drop below zero");
  return quantity{value_ - other.value_};
}

} // namespace stockpile
