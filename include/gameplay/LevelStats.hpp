/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef LEVEL_STATS_HPP
#define LEVEL_STATS_HPP

#include "gameplay/LevelProps.hpp"

/**
 * @brief Progress through the current level: which level it is, its props,
 * and how many dots are left.
 */
class LevelStats {
public:
    // Dots plus power pills in a maze
    static constexpr int TOTAL_DOTS = 244;

    // Throws std::invalid_argument when levelNumber < 1
    LevelStats(int levelNumber, const LevelPropsTable& table);

    int getLevelNumber() const { return m_levelNumber; }
    const LevelProps& getLevelProps() const { return m_props; }

    void dotEaten();
    int getDotsEaten() const { return m_dotsEaten; }
    int getDotsLeft() const { return TOTAL_DOTS - m_dotsEaten; }
    bool isCleared() const { return m_dotsEaten >= TOTAL_DOTS; }

private:
    int m_levelNumber;
    LevelProps m_props;
    int m_dotsEaten{0};
};

#endif // LEVEL_STATS_HPP
