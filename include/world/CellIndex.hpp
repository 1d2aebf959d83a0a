/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CELL_INDEX_HPP
#define CELL_INDEX_HPP

#include "utils/Vector2D.hpp"
#include <cmath>
#include <ostream>

namespace PhantomMaze {

// Side of one maze cell in pixels
inline constexpr int CELL_SIZE = 8;

/**
 * @brief Integer (column, row) coordinate of a maze cell.
 *
 * Cells are derived from pixel positions by floor division, so negative
 * pixel positions map to negative columns (used for tunnel wraparound).
 */
struct CellIndex {
    int x{0};
    int y{0};

    constexpr CellIndex() = default;
    constexpr CellIndex(int column, int row) : x(column), y(row) {}

    static CellIndex fromPosition(const Vector2D& position) {
        return CellIndex(static_cast<int>(std::floor(position.getX() / CELL_SIZE)),
                         static_cast<int>(std::floor(position.getY() / CELL_SIZE)));
    }

    Vector2D toVector() const {
        return Vector2D(static_cast<float>(x), static_cast<float>(y));
    }

    constexpr CellIndex operator+(const CellIndex& other) const {
        return CellIndex(x + other.x, y + other.y);
    }

    constexpr CellIndex operator-(const CellIndex& other) const {
        return CellIndex(x - other.x, y - other.y);
    }

    constexpr CellIndex operator*(int factor) const {
        return CellIndex(x * factor, y * factor);
    }

    constexpr bool operator==(const CellIndex& other) const = default;

    // Squared distance in cells, used to rank candidate directions
    static constexpr int distanceSquared(const CellIndex& a, const CellIndex& b) {
        const int dx = a.x - b.x;
        const int dy = a.y - b.y;
        return dx * dx + dy * dy;
    }

    friend std::ostream& operator<<(std::ostream& os, const CellIndex& cell) {
        return os << "[" << cell.x << ", " << cell.y << "]";
    }
};

} // namespace PhantomMaze

#endif // CELL_INDEX_HPP
