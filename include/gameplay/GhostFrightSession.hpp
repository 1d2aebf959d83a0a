/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GHOST_FRIGHT_SESSION_HPP
#define GHOST_FRIGHT_SESSION_HPP

#include "gameplay/LevelProps.hpp"

/**
 * @brief Window after a power pill during which ghosts can be eaten.
 *
 * Ghosts flash for the last frightFlashes * FLASH_DURATION seconds.
 */
class GhostFrightSession {
public:
    static constexpr float FLASH_DURATION = 0.4f;

    explicit GhostFrightSession(const LevelProps& props);

    void update(float deltaTime);

    bool isFinished() const { return m_timeLeft <= 0.0f; }
    bool isFlashing() const;
    float getTimeLeft() const { return m_timeLeft; }

    // Ghosts eaten during this session, used to double the score each time
    int getGhostsEaten() const { return m_ghostsEaten; }
    int ghostEaten();

private:
    float m_timeLeft;
    float m_flashTime;
    int m_ghostsEaten{0};
};

#endif // GHOST_FRIGHT_SESSION_HPP
