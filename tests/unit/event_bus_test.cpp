#include "internal/events/event_bus.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using archstore::events::Channel;
using archstore::events::CommitSummary;
using archstore::events::EventBus;
using archstore::events::MigrationEvent;

void TestEverySubscriberReceivesEvent() {
  EventBus bus;

  std::vector<uint64_t> first;
  std::vector<uint64_t> second;
  bus.commits.Subscribe([&](const CommitSummary& summary) { first.push_back(summary.sequence); });
  bus.commits.Subscribe([&](const CommitSummary& summary) { second.push_back(summary.sequence); });

  CommitSummary summary;
  summary.sequence = 7;
  summary.inserted = {"a"};
  bus.commits.Publish(summary);

  assert(first == std::vector<uint64_t>{7});
  assert(second == std::vector<uint64_t>{7});
  assert(bus.commits.SubscriberCount() == 2);
}

void TestThrowingHandlerDoesNotStopDelivery() {
  Channel<MigrationEvent> channel;

  int delivered = 0;
  channel.Subscribe([](const MigrationEvent&) { throw std::runtime_error("handler failure"); });
  channel.Subscribe([&](const MigrationEvent& event) {
    assert(event.state == "migrating");
    ++delivered;
  });

  MigrationEvent event;
  event.state = "migrating";
  channel.Publish(event);
  channel.Publish(event);

  assert(delivered == 2);
}

void TestUnsubscribeStopsDelivery() {
  Channel<MigrationEvent> channel;

  int  calls = 0;
  auto id    = channel.Subscribe([&](const MigrationEvent&) { ++calls; });
  channel.Publish({});
  channel.Unsubscribe(id);
  channel.Publish({});

  assert(calls == 1);
  assert(channel.SubscriberCount() == 0);
}

void TestHandlerMayUnsubscribeItself() {
  Channel<MigrationEvent> channel;

  int                                   calls = 0;
  Channel<MigrationEvent>::Subscription id    = 0;
  id                                          = channel.Subscribe([&](const MigrationEvent&) {
    ++calls;
    channel.Unsubscribe(id);
  });

  channel.Publish({});
  channel.Publish({});
  assert(calls == 1);
}

} // namespace

int main() {
  TestEverySubscriberReceivesEvent();
  TestThrowingHandlerDoesNotStopDelivery();
  TestUnsubscribeStopsDelivery();
  TestHandlerMayUnsubscribeItself();

  std::cout << "archstore_unit_event_bus: pass\n";
  return 0;
}
