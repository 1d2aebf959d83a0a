/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameplay/GhostMoveConductor.hpp"
#include "core/Logger.hpp"
#include <format>
#include <limits>
#include <stdexcept>

namespace {
constexpr float FOREVER = std::numeric_limits<float>::infinity();
constexpr GhostMovementMode S = GhostMovementMode::Scatter;
constexpr GhostMovementMode C = GhostMovementMode::Chase;
} // namespace

GhostMoveConductor::GhostMoveConductor(int level) {
    reset(level);
}

std::vector<GhostMoveConductor::Phase> GhostMoveConductor::scheduleForLevel(int level) {
    if (level < 1) {
        throw std::invalid_argument(std::format("Level must be 1 or higher, got {}", level));
    }

    if (level == 1) {
        return {{S, 7.0f}, {C, 20.0f}, {S, 7.0f}, {C, 20.0f},
                {S, 5.0f}, {C, 20.0f}, {S, 5.0f}, {C, FOREVER}};
    }

    if (level <= 4) {
        return {{S, 7.0f}, {C, 20.0f}, {S, 7.0f}, {C, 20.0f},
                {S, 5.0f}, {C, 1033.0f}, {S, 1.0f / 60.0f}, {C, FOREVER}};
    }

    return {{S, 5.0f}, {C, 20.0f}, {S, 5.0f}, {C, 20.0f},
            {S, 5.0f}, {C, 1037.0f}, {S, 1.0f / 60.0f}, {C, FOREVER}};
}

void GhostMoveConductor::reset(int level) {
    m_phases = scheduleForLevel(level);
    m_phaseIndex = 0;
    m_timeInPhase = 0.0f;
    m_paused = false;
}

void GhostMoveConductor::update(float deltaTime) {
    if (m_paused) {
        return;
    }

    m_timeInPhase += deltaTime;

    // A long frame can cover more than one short phase
    while (m_phaseIndex + 1 < m_phases.size() &&
           m_timeInPhase >= m_phases[m_phaseIndex].durationSeconds) {
        m_timeInPhase -= m_phases[m_phaseIndex].durationSeconds;
        ++m_phaseIndex;
        GHOST_DEBUG(std::format("Scatter/chase timer switched to {}",
                                movementModeToString(m_phases[m_phaseIndex].mode)));
    }
}
