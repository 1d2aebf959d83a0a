/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameplay/GhostFrightSession.hpp"
#include <algorithm>

GhostFrightSession::GhostFrightSession(const LevelProps& props)
    : m_timeLeft(std::max(0.0f, props.frightTimeSeconds)),
      m_flashTime(std::min(m_timeLeft, static_cast<float>(props.frightFlashes) * FLASH_DURATION)) {}

void GhostFrightSession::update(float deltaTime) {
    m_timeLeft = std::max(0.0f, m_timeLeft - deltaTime);
}

bool GhostFrightSession::isFlashing() const {
    return !isFinished() && m_timeLeft <= m_flashTime;
}

// Returns the points for this ghost: 200, 400, 800, 1600
int GhostFrightSession::ghostEaten() {
    const int points = 200 << std::min(m_ghostsEaten, 3);
    ++m_ghostsEaten;
    return points;
}
