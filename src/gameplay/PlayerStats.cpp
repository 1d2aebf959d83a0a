/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameplay/PlayerStats.hpp"
#include "core/Logger.hpp"
#include <format>

PlayerStats::PlayerStats(int startLevel, LevelPropsTable table)
    : m_table(std::move(table)),
      m_levelStats(startLevel, m_table),
      m_conductor(startLevel),
      m_houseDoor(startLevel) {}

bool PlayerStats::isFrightSessionActive() const {
    return m_frightSession && !m_frightSession->isFinished();
}

void PlayerStats::update(float deltaTime) {
    if (isFrightSessionActive()) {
        m_frightSession->update(deltaTime);
    }

    m_conductor.setPaused(isFrightSessionActive());
    m_conductor.update(deltaTime);
    m_houseDoor.update(deltaTime);
}

void PlayerStats::dotEaten() {
    m_levelStats.dotEaten();
    m_houseDoor.dotEaten();
    m_score += DOT_POINTS;
}

void PlayerStats::powerPillEaten() {
    m_levelStats.dotEaten();
    m_houseDoor.dotEaten();
    m_score += POWER_PILL_POINTS;

    m_frightSession = std::make_unique<GhostFrightSession>(m_levelStats.getLevelProps());
    LEVEL_DEBUG(std::format("Fright session started for {:.2f}s", m_frightSession->getTimeLeft()));
}

int PlayerStats::ghostEaten() {
    if (!m_frightSession) {
        LEVEL_WARN("Ghost eaten without a fright session");
        return 0;
    }

    const int points = m_frightSession->ghostEaten();
    m_score += points;
    return points;
}

void PlayerStats::newLevel() {
    const int level = m_levelStats.getLevelNumber() + 1;
    m_levelStats = LevelStats(level, m_table);
    m_conductor.reset(level);
    m_houseDoor.reset(level);
    m_frightSession.reset();
    LEVEL_INFO(std::format("Starting level {}", level));
}

void PlayerStats::newLife() {
    if (m_lives > 0) {
        --m_lives;
    }

    const int level = m_levelStats.getLevelNumber();
    m_conductor.reset(level);
    m_houseDoor.reset(level);
    m_frightSession.reset();
    LEVEL_INFO(std::format("Life lost, {} remaining", m_lives));
}
