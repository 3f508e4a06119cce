#include "internal/events/event_bus.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using pagewise::events::BookCompleted;
using pagewise::events::Event;
using pagewise::events::EventBus;
using pagewise::events::ProgressAdvanced;

BookCompleted Completed(const std::string& book_id) {
  BookCompleted event;
  event.reader_id   = "ana";
  event.book_id     = book_id;
  event.progress_id = 1;
  return event;
}

void TestHandlersRunInSubscriptionOrder() {
  EventBus         bus;
  std::vector<int> calls;
  bus.Subscribe([&calls](const Event&) { calls.push_back(1); });
  bus.Subscribe([&calls](const Event&) { calls.push_back(2); });

  bus.Publish(Completed("dune"));
  assert((calls == std::vector<int>{1, 2}));
  assert(bus.SubscriberCount() == 2);
}

void TestUnsubscribe() {
  EventBus   bus;
  int        count = 0;
  const auto id    = bus.Subscribe([&count](const Event&) { ++count; });

  bus.Publish(Completed("dune"));
  assert(bus.Unsubscribe(id));
  assert(!bus.Unsubscribe(id));
  bus.Publish(Completed("dune"));
  assert(count == 1);
  assert(bus.SubscriberCount() == 0);
}

void TestThrowingHandlerIsIsolated() {
  EventBus bus;
  int      after = 0;
  bus.Subscribe([](const Event&) { throw std::runtime_error("subscriber bug"); });
  bus.Subscribe([&after](const Event&) { ++after; });

  bus.Publish(Completed("dune"));
  assert(after == 1);
}

void TestNonStandardThrowIsIsolated() {
  EventBus bus;
  int      after = 0;
  bus.Subscribe([](const Event&) { throw 42; });
  bus.Subscribe([&after](const Event&) { ++after; });

  bus.Publish(Completed("dune"));
  assert(after == 1);
}

void TestHandlersSeeEventPayload() {
  EventBus                 bus;
  std::vector<std::string> books;
  pagewise::util::Decimal  percent;
  bus.Subscribe([&](const Event& event) {
    if (const auto* done = std::get_if<BookCompleted>(&event)) books.push_back(done->book_id);
    if (const auto* advanced = std::get_if<ProgressAdvanced>(&event)) percent = advanced->percent;
  });

  ProgressAdvanced advanced;
  advanced.percent = pagewise::util::Decimal::FromInteger(42);
  bus.Publish(advanced);
  bus.Publish(Completed("emma"));

  assert(percent == pagewise::util::Decimal::FromInteger(42));
  assert(books == std::vector<std::string>{"emma"});
}

void TestHandlerMaySubscribeDuringPublish() {
  EventBus bus;
  int      late = 0;
  bus.Subscribe([&](const Event&) {
    if (bus.SubscriberCount() == 1) bus.Subscribe([&late](const Event&) { ++late; });
  });

  bus.Publish(Completed("dune"));
  assert(late == 0);
  bus.Publish(Completed("dune"));
  assert(late == 1);
}

} // namespace

int main() {
  TestHandlersRunInSubscriptionOrder();
  TestUnsubscribe();
  TestThrowingHandlerIsIsolated();
  TestNonStandardThrowIsIsolated();
  TestHandlersSeeEventPayload();
  TestHandlerMaySubscribeDuringPublish();

  std::cout << "pagewise_unit_event_bus: pass\n";
  return 0;
}
