/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DIRECTIONS_HPP
#define DIRECTIONS_HPP

#include "utils/Vector2D.hpp"
#include "world/CellIndex.hpp"
#include <array>
#include <cstdint>
#include <ostream>

namespace PhantomMaze {

enum class Direction : uint8_t { None = 0, Up, Down, Left, Right };

// Order used when two candidate directions are equally good
inline constexpr std::array<Direction, 4> DIRECTION_PRIORITY{
    Direction::Up, Direction::Left, Direction::Down, Direction::Right};

constexpr Direction reverseDirection(Direction direction) {
    switch (direction) {
    case Direction::Up:
        return Direction::Down;
    case Direction::Down:
        return Direction::Up;
    case Direction::Left:
        return Direction::Right;
    case Direction::Right:
        return Direction::Left;
    default:
        return Direction::None;
    }
}

constexpr CellIndex directionToCellOffset(Direction direction) {
    switch (direction) {
    case Direction::Up:
        return CellIndex(0, -1);
    case Direction::Down:
        return CellIndex(0, 1);
    case Direction::Left:
        return CellIndex(-1, 0);
    case Direction::Right:
        return CellIndex(1, 0);
    default:
        return CellIndex(0, 0);
    }
}

inline Vector2D directionToVector(Direction direction) {
    return directionToCellOffset(direction).toVector();
}

constexpr bool isVertical(Direction direction) {
    return direction == Direction::Up || direction == Direction::Down;
}

constexpr bool isHorizontal(Direction direction) {
    return direction == Direction::Left || direction == Direction::Right;
}

constexpr const char* directionToString(Direction direction) {
    switch (direction) {
    case Direction::Up:
        return "Up";
    case Direction::Down:
        return "Down";
    case Direction::Left:
        return "Left";
    case Direction::Right:
        return "Right";
    default:
        return "None";
    }
}

inline std::ostream& operator<<(std::ostream& os, Direction direction) {
    return os << directionToString(direction);
}

/**
 * @brief Facing of an actor: the direction it moves in now and the one it
 * will take at the next decision point.
 */
struct DirectionInfo {
    Direction current{Direction::None};
    Direction next{Direction::None};

    constexpr DirectionInfo() = default;
    constexpr DirectionInfo(Direction currentDirection, Direction nextDirection)
        : current(currentDirection), next(nextDirection) {}

    // Turn immediately: both current and next become the given direction
    void update(Direction direction) {
        current = direction;
        next = direction;
    }

    constexpr bool operator==(const DirectionInfo& other) const = default;
};

} // namespace PhantomMaze

#endif // DIRECTIONS_HPP
