// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include <caf/expected.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace stockpile {

/// An exact fixed-point decimal with four fractional digits, matching the
/// `decimal(18,4)` columns of the ERP schema. The value is stored as an
/// integer count of 1/10000 units.
class decimal {
public:
  /// Number of fractional digits.
  static constexpr int digits = 4;

  /// Number of units per whole number.
  static constexpr int64_t scale = 10'000;

  constexpr decimal() noexcept = default;

  static constexpr decimal from_units(int64_t units) noexcept {
    return decimal{units};
  }

  /// @returns `ec::invalid_argument` if `value` has no exact representation.
  static caf::expected<decimal> from_integer(int64_t value);

  /// Parses strings such as "12", "-0.5" or "3.1415". Rejects inputs with
  /// more than four fractional digits instead of rounding them.
  static caf::expected<decimal> parse(std::string_view str);

  constexpr int64_t units() const noexcept {
    return units_;
  }

  constexpr bool is_zero() const noexcept {
    return units_ == 0;
  }

  constexpr bool is_negative() const noexcept {
    return units_ < 0;
  }

  constexpr bool is_positive() const noexcept {
    return units_ > 0;
  }

  /// @returns `ec::invalid_argument` if the result overflows.
  caf::expected<decimal> add(decimal other) const;

  /// Multiplies two decimals, rounding half away from zero.
  /// @returns `ec::invalid_argument` if the result overflows.
  caf::expected<decimal> mul(decimal other) const;

  /// Divides two decimals, rounding half away from zero.
  /// @returns `ec::invalid_argument` when dividing by zero.
  caf::expected<decimal> div(decimal other) const;

  constexpr decimal operator-() const noexcept {
    return decimal{-units_};
  }

  constexpr decimal& operator+=(decimal other) noexcept {
    units_ += other.units_;
    return *this;
  }

  constexpr decimal& operator-=(decimal other) noexcept {
    units_ -= other.units_;
    return *this;
  }

  friend constexpr decimal operator+(decimal x, decimal y) noexcept {
    return decimal{x.units_ + y.units_};
  }

  friend constexpr decimal operator-(decimal x, decimal y) noexcept {
    return decimal{x.units_ - y.units_};
  }

  friend constexpr bool operator==(decimal x, decimal y) noexcept {
    return x.units_ == y.units_;
  }

  friend constexpr bool operator!=(decimal x, decimal y) noexcept {
    return x.units_ != y.units_;
  }

  friend constexpr bool operator<(decimal x, decimal y) noexcept {
    return x.units_ < y.units_;
  }

  friend constexpr bool operator<=(decimal x, decimal y) noexcept {
    return x.units_ <= y.units_;
  }

  friend constexpr bool operator>(decimal x, decimal y) noexcept {
    return x.units_ > y.units_;
  }

  friend constexpr bool operator>=(decimal x, decimal y) noexcept {
    return x.units_ >= y.units_;
  }

private:
  constexpr explicit decimal(int64_t units) noexcept : units_(units) {
    // nop
  }

  int64_t units_ = 0;
};

/// Renders the shortest exact representation, e.g., "12.5" or "-3".
/// @relates decimal
std::string to_string(decimal x);

/// @relates decimal
template <class Inspector>
bool inspect(Inspector& f, decimal& x) {
  auto get = [&x] { return to_string(x); };
  auto set = [&x](std::string str) {
    if (auto val = decimal::parse(str)) {
      x = *val;
      return true;
    }
    return false;
  };
  return f.apply(get, set);
}

/// A non-negative decimal amount of stock.
class quantity {
public:
  constexpr quantity() noexcept = default;

  /// @returns `ec::invalid_argument` for negative values.
  static caf::expected<quantity> make(decimal value);

  /// Parses a non-negative decimal string.
  static caf::expected<quantity> parse(std::string_view str);

  constexpr decimal value() const noexcept {
    return value_;
  }

  constexpr bool is_zero() const noexcept {
    return value_.is_zero();
  }

  /// @returns `ec::invalid_argument` if the result overflows.
  caf::expected<quantity> add(quantity other) const;

  /// @returns `ec::invalid_argument` if the result would drop below zero.
  caf::expected<quantity> sub(quantity other) const;

  friend constexpr bool operator==(quantity x, quantity y) noexcept {
    return x.value_ == y.value_;
  }

  friend constexpr bool operator!=(quantity x, quantity y) noexcept {
    return x.value_ != y.value_;
  }

  friend constexpr bool operator<(quantity x, quantity y) noexcept {
    return x.value_ < y.value_;
  }

  friend constexpr bool operator<=(quantity x, quantity y) noexcept {
    return x.value_ <= y.value_;
  }

  friend constexpr bool operator>(quantity x, quantity y) noexcept {
    return x.value_ > y.value_;
  }

  friend constexpr bool operator>=(quantity x, quantity y) noexcept {
    return x.value_ >= y.value_;
  }

private:
  constexpr explicit quantity(decimal value) noexcept : value_(value) {
    // nop
  }

  decimal value_;
};

/// @relates quantity
inline std::string to_string(quantity x) {
  return to_string(x.value());
}

/// @relates quantity
template <class Inspector>
bool inspect(Inspector& f, quantity& x) {
  auto get = [&x] { return to_string(x); };
  auto set = [&x](std::string str) {
    if (auto val = quantity::parse(str)) {
      x = *val;
      return true;
    }
    return false;
  };
  return f.apply(get, set);
}

} // namespace stockpile
