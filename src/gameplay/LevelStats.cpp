/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameplay/LevelStats.hpp"
#include "core/Logger.hpp"

LevelStats::LevelStats(int levelNumber, const LevelPropsTable& table)
    : m_levelNumber(levelNumber), m_props(table.forLevel(levelNumber)) {}

void LevelStats::dotEaten() {
    if (isCleared()) {
        LEVEL_WARN("Dot eaten after the level was cleared");
        return;
    }
    ++m_dotsEaten;
}
