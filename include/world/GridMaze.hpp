/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GRID_MAZE_HPP
#define GRID_MAZE_HPP

#include "world/Maze.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace PhantomMaze {

enum class MazeCell : uint8_t { Empty, Wall, Dot, PowerPill, Tunnel, Door };

/**
 * @brief Maze built from ASCII rows.
 *
 * Legend:
 *   '#' wall, '.' dot, 'o' power pill, 'T' tunnel, '-' house door,
 *   ' ' empty floor.
 *
 * The house geometry is derived from the door cells: ghosts leave from the
 * point centred over the door, one row above it, and the house center lies
 * two rows below the door.
 */
class GridMaze : public Maze {
public:
    // Throws std::invalid_argument on empty or ragged rows, unknown
    // characters, or a maze without a house door.
    explicit GridMaze(const std::vector<std::string>& rows);

    static GridMaze classic();
    static const std::vector<std::string>& classicLayout();

    int getWidthInCells() const override { return m_width; }
    int getHeightInCells() const override { return m_height; }

    bool isTunnelCell(const CellIndex& cell) const override;
    bool isWalkable(const CellIndex& cell) const override;
    bool isHouseDoor(const CellIndex& cell) const override;

    Vector2D getHouseExitPoint() const override { return m_houseExitPoint; }
    Vector2D getHouseCenterPoint() const override { return m_houseCenterPoint; }
    CellIndex getHouseEntranceCell() const override { return m_houseEntranceCell; }

    MazeCell getCell(const CellIndex& cell) const;

    /**
     * @brief Removes the dot or power pill at the given cell.
     * @return What was there before (Dot, PowerPill, or the unchanged cell)
     */
    MazeCell consume(const CellIndex& cell);

    int getRemainingDots() const { return m_remainingDots; }

private:
    bool wrapCell(const CellIndex& cell, CellIndex& wrapped) const;
    void computeHouseGeometry();

    int m_width{0};
    int m_height{0};
    std::vector<MazeCell> m_cells;
    int m_remainingDots{0};

    Vector2D m_houseExitPoint{};
    Vector2D m_houseCenterPoint{};
    CellIndex m_houseEntranceCell{};
};

} // namespace PhantomMaze

#endif // GRID_MAZE_HPP
