/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameplay/GhostHouseDoor.hpp"
#include "core/Logger.hpp"
#include <format>

GhostHouseDoor::GhostHouseDoor(int level) {
    reset(level);
}

void GhostHouseDoor::reset(int level) {
    m_level = level;
    m_dotCounters.fill(0);
    m_released.fill(false);
    m_released[indexOf(GhostNickname::Blinky)] = true;
    m_timeSinceLastDot = 0.0f;
}

int GhostHouseDoor::personalDotLimit(int level, GhostNickname nickname) {
    switch (nickname) {
    case GhostNickname::Inky:
        return level == 1 ? 30 : 0;
    case GhostNickname::Clyde:
        if (level == 1) {
            return 60;
        }
        return level == 2 ? 50 : 0;
    default:
        return 0;
    }
}

float GhostHouseDoor::getIdleReleaseSeconds() const {
    return m_level <= 4 ? 4.0f : 3.0f;
}

void GhostHouseDoor::update(float deltaTime) {
    m_timeSinceLastDot += deltaTime;
}

void GhostHouseDoor::dotEaten() {
    m_timeSinceLastDot = 0.0f;

    const GhostNickname preferred = preferredGhost();
    if (preferred != GhostNickname::Blinky) {
        ++m_dotCounters[indexOf(preferred)];
    }
}

GhostNickname GhostHouseDoor::preferredGhost() const {
    for (GhostNickname nickname : {GhostNickname::Pinky, GhostNickname::Inky, GhostNickname::Clyde}) {
        if (!m_released[indexOf(nickname)]) {
            return nickname;
        }
    }
    return GhostNickname::Blinky;
}

bool GhostHouseDoor::canGhostLeave(GhostNickname nickname) {
    if (m_released[indexOf(nickname)]) {
        return true;
    }

    if (nickname != preferredGhost()) {
        return false;
    }

    if (m_dotCounters[indexOf(nickname)] >= personalDotLimit(m_level, nickname)) {
        m_released[indexOf(nickname)] = true;
        GHOST_DEBUG(std::format("{} released by dot counter", ghostNicknameToString(nickname)));
        return true;
    }

    if (m_timeSinceLastDot >= getIdleReleaseSeconds()) {
        m_released[indexOf(nickname)] = true;
        m_timeSinceLastDot = 0.0f;
        GHOST_DEBUG(std::format("{} released by idle timer", ghostNicknameToString(nickname)));
        return true;
    }

    return false;
}

bool GhostHouseDoor::isReleased(GhostNickname nickname) const {
    return m_released[indexOf(nickname)];
}

int GhostHouseDoor::getDotCounter(GhostNickname nickname) const {
    return m_dotCounters[indexOf(nickname)];
}
