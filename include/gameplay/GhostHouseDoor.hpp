/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GHOST_HOUSE_DOOR_HPP
#define GHOST_HOUSE_DOOR_HPP

#include "entities/ghosts/GhostTypes.hpp"
#include <array>
#include <cstddef>

/**
 * @brief Decides when each ghost may leave the house.
 *
 * Blinky is never held. Pinky, Inky and Clyde wait in that order; only the
 * first ghost still waiting counts dots. It leaves when its personal dot
 * limit for the level is reached, or when the player has gone too long
 * without eating a dot. Released ghosts stay released until reset().
 */
class GhostHouseDoor {
public:
    explicit GhostHouseDoor(int level);

    void reset(int level);
    void update(float deltaTime);
    void dotEaten();

    // Records the release when the answer is yes
    bool canGhostLeave(GhostNickname nickname);

    bool isReleased(GhostNickname nickname) const;
    int getDotCounter(GhostNickname nickname) const;
    float getTimeSinceLastDot() const { return m_timeSinceLastDot; }
    float getIdleReleaseSeconds() const;

    static int personalDotLimit(int level, GhostNickname nickname);

private:
    // First ghost (in release order) still waiting, or Blinky when none
    GhostNickname preferredGhost() const;
    static size_t indexOf(GhostNickname nickname) { return static_cast<size_t>(nickname); }

    int m_level{1};
    std::array<int, 4> m_dotCounters{};
    std::array<bool, 4> m_released{};
    float m_timeSinceLastDot{0.0f};
};

#endif // GHOST_HOUSE_DOOR_HPP
