/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_TYPE_ID_HPP
#define EVENT_TYPE_ID_HPP

#include <cstdint>

// Strongly typed event type enumeration for fast lookups
enum class EventTypeId : uint8_t {
  PlayerEaten = 0,
  GhostEaten = 1,
  GhostInsideHouse = 2,
  Custom = 3,
  COUNT = 4
};

#endif // EVENT_TYPE_ID_HPP
