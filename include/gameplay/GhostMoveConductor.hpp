/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GHOST_MOVE_CONDUCTOR_HPP
#define GHOST_MOVE_CONDUCTOR_HPP

#include "entities/ghosts/GhostTypes.hpp"
#include <cstddef>
#include <vector>

/**
 * @brief Timer that alternates the ghosts between Scatter and Chase.
 *
 * Each level has a fixed schedule of phases; the last phase lasts forever.
 * The conductor is paused while a fright session runs.
 */
class GhostMoveConductor {
public:
    struct Phase {
        GhostMovementMode mode;
        float durationSeconds;
    };

    explicit GhostMoveConductor(int level);

    void reset(int level);
    void update(float deltaTime);

    void setPaused(bool paused) { m_paused = paused; }
    bool isPaused() const { return m_paused; }

    // Always Scatter or Chase
    GhostMovementMode getCurrentMode() const { return m_phases[m_phaseIndex].mode; }
    size_t getPhaseIndex() const { return m_phaseIndex; }
    float getTimeInPhase() const { return m_timeInPhase; }

    static std::vector<Phase> scheduleForLevel(int level);

private:
    std::vector<Phase> m_phases;
    size_t m_phaseIndex{0};
    float m_timeInPhase{0.0f};
    bool m_paused{false};
};

#endif // GHOST_MOVE_CONDUCTOR_HPP
