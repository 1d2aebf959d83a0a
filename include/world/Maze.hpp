/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MAZE_HPP
#define MAZE_HPP

#include "utils/Vector2D.hpp"
#include "world/CellIndex.hpp"

namespace PhantomMaze {

/**
 * @brief Static geometry queries the ghosts rely on.
 *
 * Columns outside the maze wrap around (the side tunnel); rows outside the
 * maze are never walkable. House positions are in pixels.
 */
class Maze {
public:
    virtual ~Maze() = default;

    virtual int getWidthInCells() const = 0;
    virtual int getHeightInCells() const = 0;

    virtual bool isTunnelCell(const CellIndex& cell) const = 0;

    // Walls and the house door block ghosts moving through the maze
    virtual bool isWalkable(const CellIndex& cell) const = 0;
    virtual bool isHouseDoor(const CellIndex& cell) const = 0;

    // Point just above the door where ghosts leave the house
    virtual Vector2D getHouseExitPoint() const = 0;
    virtual Vector2D getHouseCenterPoint() const = 0;

    // Cell that returning eyes aim for before dropping into the house
    virtual CellIndex getHouseEntranceCell() const = 0;
};

} // namespace PhantomMaze

#endif // MAZE_HPP
