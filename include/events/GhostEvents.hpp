/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GHOST_EVENTS_HPP
#define GHOST_EVENTS_HPP

#include "entities/ghosts/GhostTypes.hpp"
#include "events/Event.hpp"

class Ghost;

/**
 * @brief A ghost in Normal state touched the player.
 */
class PlayerEatenEvent : public Event {
public:
    explicit PlayerEatenEvent(GhostNickname eatenBy) : m_eatenBy(eatenBy) {}

    std::string getName() const override { return "PlayerEaten"; }
    EventTypeId getTypeId() const override { return EventTypeId::PlayerEaten; }

    GhostNickname getEatenBy() const { return m_eatenBy; }

private:
    GhostNickname m_eatenBy;
};

/**
 * @brief The player caught a frightened ghost, which is now returning home
 * as eyes.
 */
class GhostEatenEvent : public Event {
public:
    explicit GhostEatenEvent(Ghost& ghost) : m_ghost(ghost) {}

    std::string getName() const override { return "GhostEaten"; }
    EventTypeId getTypeId() const override { return EventTypeId::GhostEaten; }

    Ghost& getGhost() const { return m_ghost; }

private:
    Ghost& m_ghost;
};

/**
 * @brief Returning eyes reached the center of the ghost house.
 */
class GhostInsideHouseEvent : public Event {
public:
    explicit GhostInsideHouseEvent(Ghost& ghost) : m_ghost(ghost) {}

    std::string getName() const override { return "GhostInsideHouse"; }
    EventTypeId getTypeId() const override { return EventTypeId::GhostInsideHouse; }

    Ghost& getGhost() const { return m_ghost; }

private:
    Ghost& m_ghost;
};

#endif // GHOST_EVENTS_HPP
