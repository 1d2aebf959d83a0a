/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameplay/LevelProps.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace {

LevelProps makeProps(float pacMan, float ghost, float tunnel, int elroy1Dots, float elroy1Speed,
                     int elroy2Dots, float elroy2Speed, float frightPacMan, float frightGhost,
                     float frightTime, int flashes) {
    LevelProps props;
    props.pacManSpeedPc = pacMan;
    props.ghostSpeedPc = ghost;
    props.ghostTunnelSpeedPc = tunnel;
    props.elroy1DotsLeft = elroy1Dots;
    props.elroy1SpeedPc = elroy1Speed;
    props.elroy2DotsLeft = elroy2Dots;
    props.elroy2SpeedPc = elroy2Speed;
    props.frightPacManSpeedPc = frightPacMan;
    props.frightGhostSpeedPc = frightGhost;
    props.frightTimeSeconds = frightTime;
    props.frightFlashes = flashes;
    return props;
}

void readFloat(const PhantomMaze::JsonValue& entry, const char* key, float& target) {
    if (auto value = entry[key].tryAsNumber()) {
        target = static_cast<float>(*value);
    }
}

void readInt(const PhantomMaze::JsonValue& entry, const char* key, int& target) {
    if (auto value = entry[key].tryAsInt()) {
        target = *value;
    }
}

} // namespace

LevelPropsTable::LevelPropsTable(std::vector<LevelProps> levels) : m_levels(std::move(levels)) {}

LevelPropsTable LevelPropsTable::arcade() {
    //                 pac  ghost tun  e1  e1sp  e2  e2sp  fpac fghost time flashes
    return LevelPropsTable({
        makeProps(80, 75, 40, 20, 80, 10, 85, 90, 50, 6, 5),      // 1
        makeProps(90, 85, 45, 30, 90, 15, 95, 95, 55, 5, 5),      // 2
        makeProps(90, 85, 45, 40, 90, 20, 95, 95, 55, 4, 5),      // 3
        makeProps(90, 85, 45, 40, 90, 20, 95, 95, 55, 3, 5),      // 4
        makeProps(100, 95, 50, 40, 100, 20, 105, 100, 60, 2, 5),  // 5
        makeProps(100, 95, 50, 50, 100, 25, 105, 100, 60, 5, 5),  // 6
        makeProps(100, 95, 50, 50, 100, 25, 105, 100, 60, 2, 5),  // 7
        makeProps(100, 95, 50, 50, 100, 25, 105, 100, 60, 2, 5),  // 8
        makeProps(100, 95, 50, 60, 100, 30, 105, 100, 60, 1, 3),  // 9
        makeProps(100, 95, 50, 60, 100, 30, 105, 100, 60, 5, 5),  // 10
        makeProps(100, 95, 50, 60, 100, 30, 105, 100, 60, 2, 5),  // 11
        makeProps(100, 95, 50, 80, 100, 40, 105, 100, 60, 1, 3),  // 12
        makeProps(100, 95, 50, 80, 100, 40, 105, 100, 60, 1, 3),  // 13
        makeProps(100, 95, 50, 80, 100, 40, 105, 100, 60, 3, 5),  // 14
        makeProps(100, 95, 50, 100, 100, 50, 105, 100, 60, 1, 3), // 15
        makeProps(100, 95, 50, 100, 100, 50, 105, 100, 60, 1, 3), // 16
        makeProps(100, 95, 50, 100, 100, 50, 105, 100, 60, 0, 0), // 17
        makeProps(100, 95, 50, 100, 100, 50, 105, 100, 60, 1, 3), // 18
        makeProps(100, 95, 50, 120, 100, 60, 105, 100, 60, 0, 0), // 19
        makeProps(100, 95, 50, 120, 100, 60, 105, 100, 60, 0, 0), // 20
        makeProps(90, 95, 50, 120, 100, 60, 105, 100, 60, 0, 0),  // 21+
    });
}

bool LevelPropsTable::loadFromFile(const std::string& path) {
    PhantomMaze::JsonReader reader;
    if (!reader.loadFromFile(path)) {
        LEVEL_ERROR(std::format("Failed to load level table from {}: {}", path, reader.getLastError()));
        return false;
    }

    const PhantomMaze::JsonValue& levels = reader.getRoot()["levels"];
    if (!levels.isArray() || levels.size() == 0) {
        LEVEL_ERROR(std::format("Level table {} has no \"levels\" array", path));
        return false;
    }

    const LevelPropsTable defaults = arcade();
    std::vector<LevelProps> loaded;
    loaded.reserve(levels.size());

    for (size_t i = 0; i < levels.size(); ++i) {
        const PhantomMaze::JsonValue& entry = levels[i];
        LevelProps props = defaults.forLevel(static_cast<int>(i) + 1);
        if (!entry.isObject()) {
            LEVEL_WARN(std::format("Level entry {} is not an object, using arcade values", i + 1));
            loaded.push_back(props);
            continue;
        }

        readFloat(entry, "pacManSpeedPc", props.pacManSpeedPc);
        readFloat(entry, "ghostSpeedPc", props.ghostSpeedPc);
        readFloat(entry, "ghostTunnelSpeedPc", props.ghostTunnelSpeedPc);
        readInt(entry, "elroy1DotsLeft", props.elroy1DotsLeft);
        readFloat(entry, "elroy1SpeedPc", props.elroy1SpeedPc);
        readInt(entry, "elroy2DotsLeft", props.elroy2DotsLeft);
        readFloat(entry, "elroy2SpeedPc", props.elroy2SpeedPc);
        readFloat(entry, "frightPacManSpeedPc", props.frightPacManSpeedPc);
        readFloat(entry, "frightGhostSpeedPc", props.frightGhostSpeedPc);
        readFloat(entry, "frightTimeSeconds", props.frightTimeSeconds);
        readInt(entry, "frightFlashes", props.frightFlashes);
        loaded.push_back(props);
    }

    m_levels = std::move(loaded);
    LEVEL_INFO(std::format("Loaded {} levels from {}", m_levels.size(), path));
    return true;
}

const LevelProps& LevelPropsTable::forLevel(int level) const {
    if (level < 1) {
        throw std::invalid_argument(std::format("Level must be 1 or higher, got {}", level));
    }
    if (m_levels.empty()) {
        throw std::invalid_argument("Level table is empty");
    }

    const size_t index = std::min(static_cast<size_t>(level - 1), m_levels.size() - 1);
    return m_levels[index];
}
