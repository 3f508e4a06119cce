#include "decimal.hpp"

#include <stdexcept>

namespace pagewise::util {

namespace {

using Wide = __int128;

constexpr std::int64_t Pow10(int exp) {
  std::int64_t value = 1;
  for (int i = 0; i < exp; ++i) value *= 10;
  return value;
}

std::int64_t RoundDivHalfUp(Wide numerator, Wide denominator) {
  if (denominator == 0) {
    throw std::domain_error("decimal division by zero");
  }
  if (denominator < 0) {
    numerator   = -numerator;
    denominator = -denominator;
  }
  const bool negative = numerator < 0;
  const Wide magnitude = negative ? -numerator : numerator;
  const Wide rounded   = (magnitude * 2 + denominator) / (denominator * 2);
  return static_cast<std::int64_t>(negative ? -rounded : rounded);
}

} // namespace

Decimal Decimal::FromRatio(std::int64_t numerator, std::int64_t denominator, int places) {
  if (places < 0 || places > kPlaces) {
    throw std::invalid_argument("decimal places out of range");
  }
  const Wide scaled = static_cast<Wide>(numerator) * Pow10(places);
  const auto digits = RoundDivHalfUp(scaled, denominator);
  return FromUnits(digits * Pow10(kPlaces - places));
}

Decimal Decimal::Parse(std::string_view text) {
  if (text.empty()) {
    throw std::invalid_argument("empty decimal");
  }

  bool        negative = false;
  std::size_t pos      = 0;
  if (text[0] == '-' || text[0] == '+') {
    negative = text[0] == '-';
    pos      = 1;
  }

  std::int64_t whole          = 0;
  std::int64_t fraction       = 0;
  int          fraction_digits = 0;
  bool         seen_digit     = false;
  bool         seen_point     = false;

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (c == '.') {
      if (seen_point) throw std::invalid_argument("malformed decimal: " + std::string(text));
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') {
      throw std::invalid_argument("malformed decimal: " + std::string(text));
    }
    seen_digit = true;
    if (seen_point) {
      if (++fraction_digits > kPlaces) {
        throw std::invalid_argument("too many fractional digits: " + std::string(text));
      }
      fraction = fraction * 10 + (c - '0');
    } else {
      whole = whole * 10 + (c - '0');
      if (whole > INT64_MAX / kScale) {
        throw std::invalid_argument("decimal out of range: " + std::string(text));
      }
    }
  }
  if (!seen_digit) {
    throw std::invalid_argument("malformed decimal: " + std::string(text));
  }

  const std::int64_t units = whole * kScale + fraction * Pow10(kPlaces - fraction_digits);
  return FromUnits(negative ? -units : units);
}

Decimal Decimal::Quantize(int places) const {
  if (places < 0 || places > kPlaces) {
    throw std::invalid_argument("decimal places out of range");
  }
  const auto step = Pow10(kPlaces - places);
  return FromUnits(RoundDivHalfUp(units_, step) * step);
}

std::int64_t Decimal::RoundToInteger() const {
  return RoundDivHalfUp(units_, kScale);
}

std::int64_t Decimal::Ceil() const {
  if (units_ >= 0) {
    return (units_ + kScale - 1) / kScale;
  }
  return -((-units_) / kScale);
}

std::string Decimal::ToString(int places) const {
  const auto quantized = Quantize(places);
  const bool negative  = quantized.units_ < 0;
  const auto magnitude = negative ? -quantized.units_ : quantized.units_;

  std::string out = negative ? "-" : "";
  out += std::to_string(magnitude / kScale);
  if (places > 0) {
    auto fraction = std::to_string((magnitude % kScale) / Pow10(kPlaces - places));
    out += '.';
    out.append(static_cast<std::size_t>(places) - fraction.size(), '0');
    out += fraction;
  }
  return out;
}

Decimal Decimal::Multiply(Decimal other) const {
  return FromUnits(RoundDivHalfUp(static_cast<Wide>(units_) * other.units_, kScale));
}

Decimal Decimal::Divide(Decimal other) const {
  return FromUnits(RoundDivHalfUp(static_cast<Wide>(units_) * kScale, other.units_));
}

std::int64_t MulDivRoundHalfUp(std::int64_t a, std::int64_t b, std::int64_t c) {
  if (c <= 0) {
    throw std::domain_error("MulDivRoundHalfUp requires a positive divisor");
  }
  return RoundDivHalfUp(static_cast<Wide>(a) * b, c);
}

std::int64_t CeilDiv(std::int64_t a, std::int64_t b) {
  return (a + b - 1) / b;
}

Decimal Max(Decimal a, Decimal b) {
  return a < b ? b : a;
}

Decimal Min(Decimal a, Decimal b) {
  return b < a ? b : a;
}

} // namespace pagewise::util
