#include "internal/util/decimal.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

using pagewise::util::Decimal;

void TestParseAndFormat() {
  assert(Decimal::Parse("12").ToString() == "12.00");
  assert(Decimal::Parse("0.25").ToString(2) == "0.25");
  assert(Decimal::Parse("-3.5").ToString(1) == "-3.5");
  assert(Decimal::Parse("1.2345").Units() == 12345);
  assert(Decimal::Parse("+7").Units() == 70000);
  assert(Decimal::FromInteger(3).ToString(0) == "3");
  assert(Decimal::Parse("0.05").ToString(2) == "0.05");
}

void TestParseRejectsMalformedInput() {
  for (const char* bad : {"", "-", ".", "1.2.3", "abc", "1,5", "0.12345"}) {
    bool threw = false;
    try {
      Decimal::Parse(bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestRatioRoundsHalfUp() {
  assert(Decimal::FromRatio(1, 3, 2).ToString() == "0.33");
  assert(Decimal::FromRatio(2, 3, 2).ToString() == "0.67");
  assert(Decimal::FromRatio(1, 8, 2).ToString() == "0.13");
  assert(Decimal::FromRatio(-1, 8, 2).ToString() == "-0.13");
  assert(Decimal::FromRatio(1, 200, 2).ToString() == "0.01");
  assert(Decimal::FromRatio(1, 201, 2).ToString() == "0.00");
}

void TestQuantizeAndRounding() {
  const auto value = Decimal::Parse("2.345");
  assert(value.Quantize(2) == Decimal::Parse("2.35"));
  assert(value.RoundToInteger() == 2);
  assert(Decimal::Parse("2.5").RoundToInteger() == 3);
  assert(Decimal::Parse("2.0001").Ceil() == 3);
  assert(Decimal::Parse("2").Ceil() == 2);
  assert(Decimal::Parse("-2.5").Ceil() == -2);
  assert(Decimal::Parse("0.999").ToString(2) == "1.00");
}

void TestArithmetic() {
  const auto a = Decimal::Parse("1.5");
  const auto b = Decimal::Parse("2.25");
  assert((a + b) == Decimal::Parse("3.75"));
  assert((b - a) == Decimal::Parse("0.75"));
  assert(a.Multiply(b) == Decimal::Parse("3.375"));
  assert(Decimal::FromInteger(10).Divide(Decimal::FromInteger(3)) == Decimal::Parse("3.3333"));

  auto acc = Decimal{};
  for (int i = 0; i < 3; ++i) acc += Decimal::Parse("0.1");
  assert(acc == Decimal::Parse("0.3"));

  assert(pagewise::util::Max(a, b) == b);
  assert(pagewise::util::Min(a, b) == a);
}

void TestMulDivWithoutOverflow() {
  assert(pagewise::util::MulDivRoundHalfUp(300, 18000, 36000) == 150);
  assert(pagewise::util::MulDivRoundHalfUp(1, 1, 2) == 1);
  assert(pagewise::util::MulDivRoundHalfUp(INT64_MAX / 2, 4, 4) == INT64_MAX / 2);
  assert(pagewise::util::CeilDiv(7, 2) == 4);
  assert(pagewise::util::CeilDiv(0, 5) == 0);

  bool threw = false;
  try {
    pagewise::util::MulDivRoundHalfUp(1, 1, 0);
  } catch (const std::domain_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestParseAndFormat();
  TestParseRejectsMalformedInput();
  TestRatioRoundsHalfUp();
  TestQuantizeAndRounding();
  TestArithmetic();
  TestMulDivWithoutOverflow();

  std::cout << "pagewise_unit_decimal: pass\n";
  return 0;
}
