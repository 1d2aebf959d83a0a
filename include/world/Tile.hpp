/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_HPP
#define TILE_HPP

#include "utils/Vector2D.hpp"
#include "world/CellIndex.hpp"
#include "world/Directions.hpp"
#include <boost/container/flat_map.hpp>
#include <memory>

namespace PhantomMaze {

/**
 * @brief Sub-pixel position tracker for one actor.
 *
 * A tile holds the sprite position and derives from it the cell index, the
 * cell's top-left corner and its center. Every derived value is refreshed by
 * updateWithPosition(), which also wraps the position horizontally when the
 * cell column leaves the maze (the side tunnel).
 *
 * Neighbour tiles handed out by nextTile() are cached per direction and owned
 * by this tile; each call re-positions the cached neighbour so the returned
 * reference always reflects the current position. The reference stays valid
 * until the next nextTile() call for the same direction.
 */
class Tile {
public:
    static constexpr int DEFAULT_MAZE_WIDTH_IN_CELLS = 28;
    static constexpr float CENTER_TOLERANCE = 0.75f;

    explicit Tile(int mazeWidthInCells = DEFAULT_MAZE_WIDTH_IN_CELLS);

    Tile(Tile&&) = default;
    Tile& operator=(Tile&&) = default;
    Tile(const Tile&) = delete;
    Tile& operator=(const Tile&) = delete;

    void updateWithPosition(const Vector2D& position);

    const Vector2D& getPosition() const { return m_position; }
    const CellIndex& getIndex() const { return m_index; }
    const Vector2D& getTopLeft() const { return m_topLeft; }
    const Vector2D& getCenter() const { return m_center; }
    int getMazeWidthInCells() const { return m_mazeWidthInCells; }

    bool isInCenter() const { return isNearCenter(CENTER_TOLERANCE); }
    bool isNearCenter(float precision) const;

    const Tile& nextTile(Direction direction) const;
    const Tile& nextTileWrapped(Direction direction) const;

    // cell coordinates (may be fractional) -> pixel center of that cell
    static Vector2D toCenterCanvas(const Vector2D& cellCoords);
    static Vector2D positionOf(const CellIndex& cell);
    static Tile fromIndex(const CellIndex& cell,
                          int mazeWidthInCells = DEFAULT_MAZE_WIDTH_IN_CELLS);

private:
    Tile& neighbour(Direction direction) const;
    void deriveFromPosition();
    void handleWrapping();

    int m_mazeWidthInCells;
    Vector2D m_position{};
    CellIndex m_index{};
    Vector2D m_topLeft{};
    Vector2D m_center{};

    // Memo of neighbour tiles, not part of the observable state
    mutable boost::container::flat_map<Direction, std::unique_ptr<Tile>> m_nextTiles{};
};

} // namespace PhantomMaze

#endif // TILE_HPP
