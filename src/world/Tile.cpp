/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/Tile.hpp"

namespace PhantomMaze {

Tile::Tile(int mazeWidthInCells) : m_mazeWidthInCells(mazeWidthInCells) {
    updateWithPosition(Vector2D(0.0f, 0.0f));
}

void Tile::updateWithPosition(const Vector2D& position) {
    m_position = position;
    deriveFromPosition();
    handleWrapping();
}

void Tile::deriveFromPosition() {
    m_index = CellIndex::fromPosition(m_position);
    m_topLeft = positionOf(m_index);
    m_center = m_topLeft + Vector2D(CELL_SIZE / 2.0f, CELL_SIZE / 2.0f);
}

void Tile::handleWrapping() {
    const float pixelWidthOfMaze = static_cast<float>(m_mazeWidthInCells * CELL_SIZE);

    if (m_index.x < 0) {
        updateWithPosition(m_position + Vector2D(pixelWidthOfMaze, 0.0f));
    } else if (m_index.x >= m_mazeWidthInCells) {
        updateWithPosition(m_position - Vector2D(pixelWidthOfMaze, 0.0f));
    }
}

bool Tile::isNearCenter(float precision) const {
    return m_position.isNear(m_center, precision);
}

Tile& Tile::neighbour(Direction direction) const {
    auto& slot = m_nextTiles[direction];
    if (!slot) {
        slot = std::make_unique<Tile>(m_mazeWidthInCells);
    }

    slot->updateWithPosition(m_center + directionToVector(direction) * static_cast<float>(CELL_SIZE));
    return *slot;
}

const Tile& Tile::nextTile(Direction direction) const {
    return neighbour(direction);
}

const Tile& Tile::nextTileWrapped(Direction direction) const {
    Tile& next = neighbour(direction);
    next.handleWrapping();
    return next;
}

Vector2D Tile::toCenterCanvas(const Vector2D& cellCoords) {
    const float half = CELL_SIZE / 2.0f;
    return cellCoords * static_cast<float>(CELL_SIZE) + Vector2D(half, half);
}

Vector2D Tile::positionOf(const CellIndex& cell) {
    return Vector2D(static_cast<float>(cell.x * CELL_SIZE),
                    static_cast<float>(cell.y * CELL_SIZE));
}

Tile Tile::fromIndex(const CellIndex& cell, int mazeWidthInCells) {
    Tile tile(mazeWidthInCells);
    tile.updateWithPosition(positionOf(cell));
    return tile;
}

} // namespace PhantomMaze
