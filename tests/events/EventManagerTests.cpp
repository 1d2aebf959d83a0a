/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EventManagerTests
#include <boost/test/unit_test.hpp>

#include "events/GhostEvents.hpp"
#include "managers/EventManager.hpp"
#include <stdexcept>
#include <vector>

struct EventManagerFixture {
  EventManagerFixture() {
    EventManager::Instance().clean();
    EventManager::Instance().init();
  }
  ~EventManagerFixture() { EventManager::Instance().clean(); }
};

BOOST_FIXTURE_TEST_SUITE(EventManagerTestSuite, EventManagerFixture)

BOOST_AUTO_TEST_CASE(DeferredEventsWaitForUpdate) {
  auto &events = EventManager::Instance();
  int calls = 0;
  events.registerHandler(EventTypeId::PlayerEaten,
                         [&calls](const EventData &) { ++calls; });

  BOOST_CHECK(events.triggerPlayerEaten(GhostNickname::Blinky));
  BOOST_CHECK_EQUAL(calls, 0);
  BOOST_CHECK_EQUAL(events.getPendingDispatchCount(), 1u);

  events.update();
  BOOST_CHECK_EQUAL(calls, 1);
  BOOST_CHECK_EQUAL(events.getPendingDispatchCount(), 0u);
}

BOOST_AUTO_TEST_CASE(DeferredEventsKeepPublishOrder) {
  auto &events = EventManager::Instance();
  std::vector<GhostNickname> order;
  events.registerHandler(EventTypeId::PlayerEaten, [&order](const EventData &data) {
    const auto *event = static_cast<const PlayerEatenEvent *>(data.event.get());
    order.push_back(event->getEatenBy());
  });

  events.triggerPlayerEaten(GhostNickname::Clyde);
  events.triggerPlayerEaten(GhostNickname::Blinky);
  events.triggerPlayerEaten(GhostNickname::Inky);
  events.update();

  BOOST_REQUIRE_EQUAL(order.size(), 3u);
  BOOST_CHECK_EQUAL(order[0], GhostNickname::Clyde);
  BOOST_CHECK_EQUAL(order[1], GhostNickname::Blinky);
  BOOST_CHECK_EQUAL(order[2], GhostNickname::Inky);
}

BOOST_AUTO_TEST_CASE(BacklogKeepsEveryDeferredEvent) {
  auto &events = EventManager::Instance();
  std::vector<GhostNickname> caughtBy;
  events.registerHandler(EventTypeId::PlayerEaten, [&caughtBy](const EventData &data) {
    caughtBy.push_back(static_cast<const PlayerEatenEvent *>(data.event.get())->getEatenBy());
  });

  // Far more than any frame produces; the first one still has to arrive
  constexpr size_t backlog = 1500;
  events.triggerPlayerEaten(GhostNickname::Clyde);
  for (size_t i = 1; i < backlog; ++i) {
    events.triggerPlayerEaten(GhostNickname::Blinky);
  }
  BOOST_CHECK_EQUAL(events.getPendingDispatchCount(), backlog);

  events.update();
  BOOST_REQUIRE_EQUAL(caughtBy.size(), backlog);
  BOOST_CHECK_EQUAL(caughtBy.front(), GhostNickname::Clyde);
  BOOST_CHECK_EQUAL(events.getPendingDispatchCount(), 0u);
}

BOOST_AUTO_TEST_CASE(ImmediateDispatchRunsInRegistrationOrder) {
  auto &events = EventManager::Instance();
  std::vector<int> order;
  events.registerHandler(EventTypeId::PlayerEaten,
                         [&order](const EventData &) { order.push_back(1); });
  events.registerHandler(EventTypeId::PlayerEaten,
                         [&order](const EventData &) { order.push_back(2); });

  BOOST_CHECK(events.triggerPlayerEaten(GhostNickname::Pinky,
                                        EventManager::DispatchMode::Immediate));
  BOOST_REQUIRE_EQUAL(order.size(), 2u);
  BOOST_CHECK_EQUAL(order[0], 1);
  BOOST_CHECK_EQUAL(order[1], 2);
  BOOST_CHECK_EQUAL(events.getPendingDispatchCount(), 0u);
}

BOOST_AUTO_TEST_CASE(ImmediateDispatchWithoutHandlersReportsFalse) {
  auto &events = EventManager::Instance();
  BOOST_CHECK(!events.triggerPlayerEaten(GhostNickname::Pinky,
                                         EventManager::DispatchMode::Immediate));
}

BOOST_AUTO_TEST_CASE(EventsReachOnlyTheirType) {
  auto &events = EventManager::Instance();
  int playerEaten = 0;
  int other = 0;
  events.registerHandler(EventTypeId::PlayerEaten,
                         [&playerEaten](const EventData &) { ++playerEaten; });
  events.registerHandler(EventTypeId::GhostInsideHouse,
                         [&other](const EventData &) { ++other; });

  events.triggerPlayerEaten(GhostNickname::Blinky);
  events.update();

  BOOST_CHECK_EQUAL(playerEaten, 1);
  BOOST_CHECK_EQUAL(other, 0);
}

BOOST_AUTO_TEST_CASE(TokenRemovesSingleHandler) {
  auto &events = EventManager::Instance();
  int first = 0;
  int second = 0;
  auto token = events.registerHandlerWithToken(
      EventTypeId::PlayerEaten, [&first](const EventData &) { ++first; });
  events.registerHandler(EventTypeId::PlayerEaten,
                         [&second](const EventData &) { ++second; });
  BOOST_CHECK_EQUAL(events.getHandlerCount(EventTypeId::PlayerEaten), 2u);

  BOOST_CHECK(events.removeHandler(token));
  BOOST_CHECK(!events.removeHandler(token));
  BOOST_CHECK_EQUAL(events.getHandlerCount(EventTypeId::PlayerEaten), 1u);

  events.triggerPlayerEaten(GhostNickname::Blinky,
                            EventManager::DispatchMode::Immediate);
  BOOST_CHECK_EQUAL(first, 0);
  BOOST_CHECK_EQUAL(second, 1);
}

BOOST_AUTO_TEST_CASE(ThrowingHandlerDoesNotStopDelivery) {
  auto &events = EventManager::Instance();
  int reached = 0;
  events.registerHandler(EventTypeId::PlayerEaten, [](const EventData &) {
    throw std::runtime_error("handler failure");
  });
  events.registerHandler(EventTypeId::PlayerEaten,
                         [&reached](const EventData &) { ++reached; });

  events.triggerPlayerEaten(GhostNickname::Blinky);
  BOOST_CHECK_NO_THROW(events.update());
  BOOST_CHECK_EQUAL(reached, 1);
}

BOOST_AUTO_TEST_CASE(EventsPublishedByHandlersWaitForNextUpdate) {
  auto &events = EventManager::Instance();
  int calls = 0;
  events.registerHandler(EventTypeId::PlayerEaten, [&](const EventData &) {
    if (++calls == 1) {
      events.triggerPlayerEaten(GhostNickname::Pinky);
    }
  });

  events.triggerPlayerEaten(GhostNickname::Blinky);
  events.update();
  BOOST_CHECK_EQUAL(calls, 1);
  BOOST_CHECK_EQUAL(events.getPendingDispatchCount(), 1u);

  events.update();
  BOOST_CHECK_EQUAL(calls, 2);
}

BOOST_AUTO_TEST_CASE(CleanDropsHandlersAndQueue) {
  auto &events = EventManager::Instance();
  events.registerHandler(EventTypeId::PlayerEaten, [](const EventData &) {});
  events.triggerPlayerEaten(GhostNickname::Blinky);

  events.clean();
  BOOST_CHECK(!events.isInitialized());
  BOOST_CHECK_EQUAL(events.getHandlerCount(EventTypeId::PlayerEaten), 0u);
  BOOST_CHECK_EQUAL(events.getPendingDispatchCount(), 0u);
}

BOOST_AUTO_TEST_CASE(EventDataCarriesTypeAndName) {
  auto &events = EventManager::Instance();
  EventTypeId seenType = EventTypeId::Custom;
  std::string seenName;
  std::string eventName;
  events.registerHandler(EventTypeId::PlayerEaten, [&](const EventData &data) {
    seenType = data.typeId;
    seenName = data.name;
    eventName = data.event->getName();
  });

  events.triggerPlayerEaten(GhostNickname::Blinky,
                            EventManager::DispatchMode::Immediate);
  BOOST_CHECK(seenType == EventTypeId::PlayerEaten);
  BOOST_CHECK_EQUAL(seenName, "trigger_player_eaten");
  BOOST_CHECK_EQUAL(eventName, "PlayerEaten");
}

BOOST_AUTO_TEST_SUITE_END()
