/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/EventManager.hpp"
#include "core/Logger.hpp"
#include "events/GhostEvents.hpp"
#include <algorithm>
#include <exception>
#include <format>

EventManager &EventManager::Instance() {
  static EventManager instance;
  return instance;
}

bool EventManager::init() {
  if (m_initialized) {
    EVENT_WARN("EventManager already initialized");
    return true;
  }

  for (auto &handlers : m_handlersByType) {
    handlers.clear();
  }
  m_pendingDispatch.clear();
  m_initialized = true;

  EVENT_INFO("EventManager initialized");
  return true;
}

void EventManager::clean() {
  clearAllHandlers();
  m_pendingDispatch.clear();
  m_initialized = false;
  EVENT_INFO("EventManager cleaned");
}

void EventManager::update() {
  // Handlers may publish further events; those wait for the next update
  std::deque<PendingDispatch> local;
  local.swap(m_pendingDispatch);

  for (const auto &pd : local) {
    invokeHandlers(pd.typeId, pd.data, "deferred dispatch");
  }
}

void EventManager::registerHandler(EventTypeId typeId,
                                   FastEventHandler handler) {
  (void)registerHandlerWithToken(typeId, std::move(handler));
}

void EventManager::removeHandlers(EventTypeId typeId) {
  m_handlersByType[static_cast<size_t>(typeId)].clear();
}

void EventManager::clearAllHandlers() {
  for (auto &handlers : m_handlersByType) {
    handlers.clear();
  }
  EVENT_INFO("All event handlers cleared");
}

size_t EventManager::getHandlerCount(EventTypeId typeId) const {
  const auto &entries = m_handlersByType[static_cast<size_t>(typeId)];
  return static_cast<size_t>(
      std::count_if(entries.begin(), entries.end(),
                    [](const HandlerEntry &entry) { return static_cast<bool>(entry); }));
}

EventManager::HandlerToken
EventManager::registerHandlerWithToken(EventTypeId typeId, FastEventHandler handler) {
  const uint64_t id = m_nextHandlerId++;
  m_handlersByType[static_cast<size_t>(typeId)].emplace_back(std::move(handler), id);
  return HandlerToken{typeId, id};
}

bool EventManager::removeHandler(const HandlerToken &token) {
  const size_t idx = static_cast<size_t>(token.typeId);
  if (idx >= m_handlersByType.size()) return false;

  auto &entries = m_handlersByType[idx];
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&token](const HandlerEntry &entry) {
                           return entry.id == token.id;
                         });
  if (it == entries.end() || !*it) {
    return false;
  }

  // Invalidate instead of erasing so a handler can remove itself mid-dispatch
  *it = HandlerEntry();
  return true;
}

bool EventManager::triggerPlayerEaten(GhostNickname eatenBy,
                                      DispatchMode mode) const {
  EventData data;
  data.typeId = EventTypeId::PlayerEaten;
  data.name = "trigger_player_eaten";
  data.event = std::make_shared<PlayerEatenEvent>(eatenBy);
  return dispatchEvent(EventTypeId::PlayerEaten, data, mode, "triggerPlayerEaten");
}

bool EventManager::triggerGhostEaten(Ghost &ghost, DispatchMode mode) const {
  EventData data;
  data.typeId = EventTypeId::GhostEaten;
  data.name = "trigger_ghost_eaten";
  data.event = std::make_shared<GhostEatenEvent>(ghost);
  return dispatchEvent(EventTypeId::GhostEaten, data, mode, "triggerGhostEaten");
}

bool EventManager::triggerGhostInsideHouse(Ghost &ghost, DispatchMode mode) const {
  EventData data;
  data.typeId = EventTypeId::GhostInsideHouse;
  data.name = "trigger_ghost_inside_house";
  data.event = std::make_shared<GhostInsideHouseEvent>(ghost);
  return dispatchEvent(EventTypeId::GhostInsideHouse, data, mode,
                       "triggerGhostInsideHouse");
}

bool EventManager::dispatchEvent(EventTypeId typeId, EventData &eventData,
                                 DispatchMode mode,
                                 const char *errorContext) const {
  if (mode == DispatchMode::Immediate) {
    if (getHandlerCount(typeId) == 0) {
      return false;
    }
    invokeHandlers(typeId, eventData, errorContext);
    return true;
  }

  enqueueDispatch(typeId, eventData);
  return true;
}

void EventManager::invokeHandlers(EventTypeId typeId, const EventData &eventData,
                                  const char *errorContext) const {
  const auto &typeHandlers = m_handlersByType[static_cast<size_t>(typeId)];

  // Index loop: handlers may register new handlers while we iterate
  for (size_t i = 0; i < typeHandlers.size(); ++i) {
    if (!typeHandlers[i]) {
      continue;
    }
    FastEventHandler handler = typeHandlers[i].callable;
    try {
      handler(eventData);
    } catch (const std::exception &e) {
      EVENT_ERROR(std::format("Handler exception in {} ({}): {}", errorContext,
                              eventData.event ? eventData.event->getName() : eventData.name,
                              e.what()));
    }
  }
}

void EventManager::enqueueDispatch(EventTypeId typeId, const EventData &data) const {
  m_pendingDispatch.push_back(PendingDispatch{typeId, data});
}
