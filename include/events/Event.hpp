/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef EVENT_HPP
#define EVENT_HPP

/**
 * @file Event.hpp
 * @brief Base class for all event types in the game
 *
 * Events describe something that already happened in the maze (a ghost
 * caught the player, the player ate a ghost, eyes reached the house). They
 * carry data only; handlers registered with the EventManager react to them.
 */

#include <memory>
#include <string>
#include "events/EventTypeId.hpp"

class Event;

using EventPtr = std::shared_ptr<Event>;

class Event {
public:
    virtual ~Event() = default;

    // Shown in the event log
    virtual std::string getName() const = 0;
    // Selects the handlers that receive the event
    virtual EventTypeId getTypeId() const = 0;
};

#endif // EVENT_HPP
