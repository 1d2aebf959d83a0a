/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef LEVEL_PROPS_HPP
#define LEVEL_PROPS_HPP

#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Per-level tuning: speeds as percentages of the base speed, fright
 * duration and the dot thresholds at which Blinky speeds up ("Elroy").
 */
struct LevelProps {
    float pacManSpeedPc{80.0f};
    float ghostSpeedPc{75.0f};
    float ghostTunnelSpeedPc{40.0f};
    int elroy1DotsLeft{20};
    float elroy1SpeedPc{80.0f};
    int elroy2DotsLeft{10};
    float elroy2SpeedPc{85.0f};
    float frightPacManSpeedPc{90.0f};
    float frightGhostSpeedPc{50.0f};
    float frightTimeSeconds{6.0f};
    int frightFlashes{5};
};

/**
 * @brief Ordered list of LevelProps, one per level. Levels past the end of
 * the table reuse the last entry.
 */
class LevelPropsTable {
public:
    LevelPropsTable() = default;
    explicit LevelPropsTable(std::vector<LevelProps> levels);

    // The original arcade values for levels 1 to 21
    static LevelPropsTable arcade();

    /**
     * @brief Replaces the table with the "levels" array of a JSON file.
     *
     * Keys missing from an entry keep the arcade value for that level.
     * @return false (table unchanged) if the file cannot be read or has no
     * usable "levels" array
     */
    bool loadFromFile(const std::string& path);

    // Throws std::invalid_argument for level < 1 or an empty table
    const LevelProps& forLevel(int level) const;

    size_t size() const { return m_levels.size(); }

private:
    std::vector<LevelProps> m_levels;
};

#endif // LEVEL_PROPS_HPP
