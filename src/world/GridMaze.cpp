/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/GridMaze.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace PhantomMaze {

namespace {
MazeCell parseCell(char c, int column, int row) {
    switch (c) {
    case '#':
        return MazeCell::Wall;
    case '.':
        return MazeCell::Dot;
    case 'o':
        return MazeCell::PowerPill;
    case 'T':
        return MazeCell::Tunnel;
    case '-':
        return MazeCell::Door;
    case ' ':
        return MazeCell::Empty;
    default:
        throw std::invalid_argument(
            std::format("Unknown maze character '{}' at column {}, row {}", c, column, row));
    }
}
} // namespace

GridMaze::GridMaze(const std::vector<std::string>& rows) {
    if (rows.empty() || rows.front().empty()) {
        throw std::invalid_argument("Maze layout must have at least one non-empty row");
    }

    m_width = static_cast<int>(rows.front().size());
    m_height = static_cast<int>(rows.size());
    m_cells.reserve(static_cast<size_t>(m_width * m_height));

    for (int row = 0; row < m_height; ++row) {
        const std::string& line = rows[static_cast<size_t>(row)];
        if (static_cast<int>(line.size()) != m_width) {
            throw std::invalid_argument(std::format(
                "Maze row {} has {} cells, expected {}", row, line.size(), m_width));
        }
        for (int column = 0; column < m_width; ++column) {
            const MazeCell cell = parseCell(line[static_cast<size_t>(column)], column, row);
            if (cell == MazeCell::Dot || cell == MazeCell::PowerPill) {
                ++m_remainingDots;
            }
            m_cells.push_back(cell);
        }
    }

    computeHouseGeometry();

    MAZE_INFO(std::format("Maze {}x{} loaded with {} dots", m_width, m_height, m_remainingDots));
}

GridMaze GridMaze::classic() {
    return GridMaze(classicLayout());
}

const std::vector<std::string>& GridMaze::classicLayout() {
    static const std::vector<std::string> layout{
        "############################",
        "#............##............#",
        "#.####.#####.##.#####.####.#",
        "#o####.#####.##.#####.####o#",
        "#.####.#####.##.#####.####.#",
        "#..........................#",
        "#.####.##.########.##.####.#",
        "#.####.##.########.##.####.#",
        "#......##....##....##......#",
        "######.##### ## #####.######",
        "     #.##### ## #####.#     ",
        "     #.##          ##.#     ",
        "     #.## ###--### ##.#     ",
        "######.## #      # ##.######",
        "TTTTTT.   #      #   .TTTTTT",
        "######.## #      # ##.######",
        "     #.## ######## ##.#     ",
        "     #.##          ##.#     ",
        "     #.## ######## ##.#     ",
        "######.## ######## ##.######",
        "#............##............#",
        "#.####.#####.##.#####.####.#",
        "#.####.#####.##.#####.####.#",
        "#o..##.......  .......##..o#",
        "###.##.##.########.##.##.###",
        "###.##.##.########.##.##.###",
        "#......##....##....##......#",
        "#.##########.##.##########.#",
        "#.##########.##.##########.#",
        "#..........................#",
        "############################"
    };
    return layout;
}

bool GridMaze::wrapCell(const CellIndex& cell, CellIndex& wrapped) const {
    if (cell.y < 0 || cell.y >= m_height) {
        return false;
    }
    wrapped = CellIndex(((cell.x % m_width) + m_width) % m_width, cell.y);
    return true;
}

MazeCell GridMaze::getCell(const CellIndex& cell) const {
    CellIndex wrapped;
    if (!wrapCell(cell, wrapped)) {
        return MazeCell::Wall;
    }
    return m_cells[static_cast<size_t>(wrapped.y * m_width + wrapped.x)];
}

bool GridMaze::isTunnelCell(const CellIndex& cell) const {
    return getCell(cell) == MazeCell::Tunnel;
}

bool GridMaze::isWalkable(const CellIndex& cell) const {
    const MazeCell content = getCell(cell);
    return content != MazeCell::Wall && content != MazeCell::Door;
}

bool GridMaze::isHouseDoor(const CellIndex& cell) const {
    return getCell(cell) == MazeCell::Door;
}

MazeCell GridMaze::consume(const CellIndex& cell) {
    CellIndex wrapped;
    if (!wrapCell(cell, wrapped)) {
        return MazeCell::Wall;
    }

    MazeCell& content = m_cells[static_cast<size_t>(wrapped.y * m_width + wrapped.x)];
    const MazeCell previous = content;
    if (previous == MazeCell::Dot || previous == MazeCell::PowerPill) {
        content = MazeCell::Empty;
        --m_remainingDots;
    }
    return previous;
}

void GridMaze::computeHouseGeometry() {
    int doorRow = -1;
    int minColumn = m_width;
    int maxColumn = -1;

    for (int row = 0; row < m_height && doorRow < 0; ++row) {
        for (int column = 0; column < m_width; ++column) {
            if (m_cells[static_cast<size_t>(row * m_width + column)] == MazeCell::Door) {
                doorRow = row;
                minColumn = std::min(minColumn, column);
                maxColumn = std::max(maxColumn, column);
            }
        }
    }

    if (doorRow < 1 || doorRow + 2 >= m_height) {
        throw std::invalid_argument("Maze needs a house door with a row above and two rows below it");
    }

    // Door spans [minColumn, maxColumn]; ghosts pass through its middle
    const float exitX = static_cast<float>((minColumn + maxColumn + 1) * CELL_SIZE) / 2.0f;
    const float half = CELL_SIZE / 2.0f;

    m_houseExitPoint = Vector2D(exitX, static_cast<float>((doorRow - 1) * CELL_SIZE) + half);
    m_houseCenterPoint = Vector2D(exitX, static_cast<float>((doorRow + 2) * CELL_SIZE) + half);
    m_houseEntranceCell = CellIndex(minColumn, doorRow - 1);
}

} // namespace PhantomMaze
