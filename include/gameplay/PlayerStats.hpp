/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLAYER_STATS_HPP
#define PLAYER_STATS_HPP

#include "gameplay/GhostFrightSession.hpp"
#include "gameplay/GhostHouseDoor.hpp"
#include "gameplay/GhostMoveConductor.hpp"
#include "gameplay/LevelProps.hpp"
#include "gameplay/LevelStats.hpp"
#include <memory>

/**
 * @brief Everything the ghosts read about the player currently playing:
 * the level, the scatter/chase timer, the house door and the fright session
 * started by the last power pill.
 */
class PlayerStats {
public:
    static constexpr int STARTING_LIVES = 3;
    static constexpr int DOT_POINTS = 10;
    static constexpr int POWER_PILL_POINTS = 50;

    explicit PlayerStats(int startLevel = 1, LevelPropsTable table = LevelPropsTable::arcade());

    /**
     * @brief Advances the timers. The scatter/chase timer stands still while
     * a fright session is running.
     */
    void update(float deltaTime);

    void dotEaten();
    // Counts as a dot and starts a new fright session
    void powerPillEaten();
    // Returns the points scored for the ghost
    int ghostEaten();

    void newLevel();
    void newLife();

    const LevelStats& getLevelStats() const { return m_levelStats; }
    GhostMoveConductor& getGhostMoveConductor() { return m_conductor; }
    const GhostMoveConductor& getGhostMoveConductor() const { return m_conductor; }
    GhostHouseDoor& getGhostHouseDoor() { return m_houseDoor; }
    const GhostHouseDoor& getGhostHouseDoor() const { return m_houseDoor; }

    // nullptr until the first power pill of the level or life
    const GhostFrightSession* getFrightSession() const { return m_frightSession.get(); }
    bool isFrightSessionActive() const;

    int getScore() const { return m_score; }
    int getLives() const { return m_lives; }

private:
    LevelPropsTable m_table;
    LevelStats m_levelStats;
    GhostMoveConductor m_conductor;
    GhostHouseDoor m_houseDoor;
    std::unique_ptr<GhostFrightSession> m_frightSession;
    int m_score{0};
    int m_lives{STARTING_LIVES};
};

#endif // PLAYER_STATS_HPP
