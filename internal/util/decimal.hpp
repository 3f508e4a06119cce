#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace pagewise::util {

/*
  Exact fixed-point decimal.

  Stored as a signed count of 1/10000 units. Every operation that can produce
  digits beyond that precision rounds half-up (away from zero on ties), which
  matches the rounding used for percentages and page equivalents.

  No floating point is involved anywhere in construction, arithmetic or
  formatting.
*/
class Decimal {
 public:
  static constexpr int          kPlaces = 4;
  static constexpr std::int64_t kScale  = 10000;

  constexpr Decimal() = default;

  static constexpr Decimal FromUnits(std::int64_t units) {
    Decimal d;
    d.units_ = units;
    return d;
  }

  static constexpr Decimal FromInteger(std::int64_t value) {
    return FromUnits(value * kScale);
  }

  // numerator / denominator rounded half-up to `places` fractional digits.
  static Decimal FromRatio(std::int64_t numerator, std::int64_t denominator, int places = kPlaces);

  // Accepts "12", "-3.5", "0.25". Throws std::invalid_argument on malformed
  // input or more than kPlaces fractional digits.
  static Decimal Parse(std::string_view text);

  constexpr std::int64_t Units() const {
    return units_;
  }

  Decimal      Quantize(int places) const;
  std::int64_t RoundToInteger() const;
  std::int64_t Ceil() const;
  bool         IsZero() const {
    return units_ == 0;
  }

  // Fixed number of fractional digits, e.g. ToString(2) == "12.50".
  std::string ToString(int places = 2) const;

  Decimal operator+(Decimal other) const {
    return FromUnits(units_ + other.units_);
  }
  Decimal operator-(Decimal other) const {
    return FromUnits(units_ - other.units_);
  }
  Decimal& operator+=(Decimal other) {
    units_ += other.units_;
    return *this;
  }
  Decimal& operator-=(Decimal other) {
    units_ -= other.units_;
    return *this;
  }

  Decimal Multiply(Decimal other) const;
  Decimal Divide(Decimal other) const;

  constexpr auto operator<=>(const Decimal&) const = default;

 private:
  std::int64_t units_ = 0;
};

// Round-half-up of (a * b) / c computed without intermediate overflow.
// c must be positive.
std::int64_t MulDivRoundHalfUp(std::int64_t a, std::int64_t b, std::int64_t c);

// Ceil of (a / b) for a >= 0, b > 0.
std::int64_t CeilDiv(std::int64_t a, std::int64_t b);

Decimal Max(Decimal a, Decimal b);
Decimal Min(Decimal a, Decimal b);

} // namespace pagewise::util
