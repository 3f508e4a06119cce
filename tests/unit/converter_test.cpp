#include "internal/equivalence/converter.hpp"

#include <cassert>
#include <iostream>

namespace {

using pagewise::equivalence::Converter;
using pagewise::model::Medium;
using pagewise::model::MediumState;
using pagewise::model::ProgressRecord;
using pagewise::util::Decimal;

MediumState Make(Medium medium) {
  MediumState state;
  state.medium = medium;
  return state;
}

void TestReferencePagesPrefersCustomTotal() {
  ProgressRecord record;
  assert(!Converter::ReferencePages(record, std::nullopt));
  assert(*Converter::ReferencePages(record, 300) == 300);
  assert(!Converter::ReferencePages(record, 0));

  record.custom_total_pages = 320;
  assert(*Converter::ReferencePages(record, 300) == 320);
  assert(*Converter::ReferencePages(record, std::nullopt) == 320);
}

void TestTotals() {
  auto paper = Make(Medium::kPaper);
  assert(*Converter::TotalForMedium(paper, 300) == 300);
  assert(!Converter::TotalForMedium(paper, std::nullopt));

  auto ebook                 = Make(Medium::kEbook);
  ebook.total_pages_override = 400;
  assert(*Converter::TotalForMedium(ebook, 300) == 400);
  assert(*Converter::TotalForMedium(ebook, std::nullopt) == 400);

  auto audio = Make(Medium::kAudio);
  assert(!Converter::TotalForMedium(audio, 300));
  audio.length_seconds = 36000;
  assert(*Converter::TotalForMedium(audio, 300) == 36000);
}

void TestPaperEquivalenceIsThePage() {
  const auto paper = Make(Medium::kPaper);
  assert(*Converter::ToPagesEquivalent(paper, 120, 300) == Decimal::FromInteger(120));
  assert(!Converter::ToPagesEquivalent(paper, 120, std::nullopt));
}

void TestEbookEditionIsRescaled() {
  auto ebook                 = Make(Medium::kEbook);
  ebook.total_pages_override = 400;
  assert(*Converter::ToPagesEquivalent(ebook, 200, 300) == Decimal::FromInteger(150));
  assert(*Converter::ToPagesEquivalent(ebook, 1, 300) == Decimal::Parse("0.75"));
  // 300 * 1 / 7 = 42.857...
  ebook.total_pages_override = 7;
  assert(*Converter::ToPagesEquivalent(ebook, 1, 300) == Decimal::Parse("42.86"));

  ebook.total_pages_override = 300;
  assert(*Converter::ToPagesEquivalent(ebook, 17, 300) == Decimal::FromInteger(17));
}

void TestAudioEquivalence() {
  auto audio           = Make(Medium::kAudio);
  audio.length_seconds = 36000;
  assert(*Converter::ToPagesEquivalent(audio, 18000, 300) == Decimal::FromInteger(150));
  assert(*Converter::ToPagesEquivalent(audio, 1, 300) == Decimal::Parse("0.01"));
  assert(!Converter::ToPagesEquivalent(audio, 18000, std::nullopt));

  audio.length_seconds.reset();
  assert(!Converter::ToPagesEquivalent(audio, 18000, 300));
}

void TestPercentages() {
  assert(Converter::PercentOf(18000, 36000) == Decimal::Parse("50.00"));
  assert(Converter::PercentOf(1, 3) == Decimal::Parse("33.33"));
  assert(Converter::PercentOf(2, 3) == Decimal::Parse("66.67"));
  assert(Converter::PercentOf(300, 300) == Decimal::FromInteger(100));
  assert(Converter::PercentOf(301, 300) == Decimal::FromInteger(100));
  assert(Converter::PercentOf(0, 300) == Decimal{});

  assert(Converter::RawForPercent(400, Decimal::FromInteger(50)) == 200);
  assert(Converter::RawForPercent(36000, Decimal::Parse("33.33")) == 11999);
  assert(Converter::RawForPercent(3, Decimal::Parse("50")) == 2);
  assert(Converter::RawForPercent(300, Decimal::FromInteger(100)) == 300);
}

void TestSpeedAdjustment() {
  assert(Converter::AdjustForSpeed(3600, Decimal::Parse("1.5")) == 5400);
  assert(Converter::AdjustForSpeed(3600, Decimal::FromInteger(1)) == 3600);
  assert(Converter::AdjustForSpeed(1, Decimal::Parse("0.5")) == 1);
  assert(Converter::ListenedSeconds(5400, Decimal::Parse("1.5")) == 3600);
  assert(Converter::ListenedSeconds(3600, Decimal::FromInteger(2)) == 1800);

  ProgressRecord record;
  record.playback_speed = Decimal::Parse("1.25");
  auto audio            = Make(Medium::kAudio);
  assert(Converter::EffectiveSpeed(record, audio) == Decimal::Parse("1.25"));
  audio.playback_speed = Decimal::FromInteger(2);
  assert(Converter::EffectiveSpeed(record, audio) == Decimal::FromInteger(2));
}

} // namespace

int main() {
  TestReferencePagesPrefersCustomTotal();
  TestTotals();
  TestPaperEquivalenceIsThePage();
  TestEbookEditionIsRescaled();
  TestAudioEquivalence();
  TestPercentages();
  TestSpeedAdjustment();

  std::cout << "pagewise_unit_converter: pass\n";
  return 0;
}
