/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef EVENT_MANAGER_HPP
#define EVENT_MANAGER_HPP

/**
 * @file EventManager.hpp
 * @brief Type-indexed event bus for maze gameplay events
 *
 * Handlers are registered per EventTypeId and receive an EventData payload.
 * Events are either dispatched immediately (handlers run inside the trigger
 * call) or deferred until the next update(), which delivers them in the
 * order they were published. The game loop is single threaded, so there is
 * no locking.
 */

#include "entities/ghosts/GhostTypes.hpp"
#include "events/Event.hpp"
#include "events/EventTypeId.hpp"
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

class Ghost;

/**
 * @brief Payload handed to event handlers
 */
struct EventData {
  EventPtr event;     // The event being delivered
  std::string name;   // Name of the trigger that produced it
  EventTypeId typeId{EventTypeId::Custom};
};

/**
 * @brief Event handler function type
 */
using FastEventHandler = std::function<void(const EventData &)>;

class EventManager {
public:
  static EventManager &Instance();

  // Dispatch control for handler execution
  enum class DispatchMode : uint8_t { Deferred = 0, Immediate = 1 };

  /**
   * @brief Initializes the EventManager
   * @return true if initialization successful, false otherwise
   */
  bool init();

  bool isInitialized() const { return m_initialized; }

  /**
   * @brief Drops all handlers and pending events
   */
  void clean();

  /**
   * @brief Delivers every deferred event in publish order
   */
  void update();

  // Handler registration (type-safe)
  void registerHandler(EventTypeId typeId, FastEventHandler handler);
  void removeHandlers(EventTypeId typeId);
  void clearAllHandlers();
  size_t getHandlerCount(EventTypeId typeId) const;

  // Token-based handler management
  struct HandlerToken {
    EventTypeId typeId;
    uint64_t id;
  };
  HandlerToken registerHandlerWithToken(EventTypeId typeId,
                                        FastEventHandler handler);
  bool removeHandler(const HandlerToken &token);

  size_t getPendingDispatchCount() const { return m_pendingDispatch.size(); }

  // High-level convenience methods
  bool triggerPlayerEaten(GhostNickname eatenBy,
                          DispatchMode mode = DispatchMode::Deferred) const;
  bool triggerGhostEaten(Ghost &ghost,
                         DispatchMode mode = DispatchMode::Deferred) const;
  bool triggerGhostInsideHouse(Ghost &ghost,
                               DispatchMode mode = DispatchMode::Deferred) const;

  /**
   * @brief Routes an event to its handlers
   * @return false when an immediate dispatch found no handler
   */
  bool dispatchEvent(EventTypeId typeId, EventData &eventData, DispatchMode mode,
                     const char *errorContext) const;

private:
  EventManager() = default;
  ~EventManager() = default;
  EventManager(const EventManager &) = delete;
  EventManager &operator=(const EventManager &) = delete;

  struct HandlerEntry {
    FastEventHandler callable;
    uint64_t id{0};

    HandlerEntry() = default;
    HandlerEntry(FastEventHandler handler, uint64_t handlerId)
        : callable(std::move(handler)), id(handlerId) {}

    explicit operator bool() const { return static_cast<bool>(callable); }
  };

  struct PendingDispatch {
    EventTypeId typeId;
    EventData data;
  };

  void invokeHandlers(EventTypeId typeId, const EventData &eventData,
                      const char *errorContext) const;
  void enqueueDispatch(EventTypeId typeId, const EventData &data) const;

  std::array<std::vector<HandlerEntry>, static_cast<size_t>(EventTypeId::COUNT)>
      m_handlersByType{};
  uint64_t m_nextHandlerId{1};

  // Deferred dispatch queue, emptied by every update() and never trimmed
  mutable std::deque<PendingDispatch> m_pendingDispatch;

  bool m_initialized{false};
};

#endif // EVENT_MANAGER_HPP
