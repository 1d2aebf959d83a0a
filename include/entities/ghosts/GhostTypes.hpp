/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GHOST_TYPES_HPP
#define GHOST_TYPES_HPP

#include <array>
#include <cstdint>
#include <ostream>

enum class GhostNickname : uint8_t { Blinky = 0, Pinky = 1, Inky = 2, Clyde = 3 };

inline constexpr std::array<GhostNickname, 4> ALL_GHOSTS{
    GhostNickname::Blinky, GhostNickname::Pinky, GhostNickname::Inky, GhostNickname::Clyde};

// Vulnerability of a ghost to the player
enum class GhostState : uint8_t { Normal, Frightened, Eyes };

enum class GhostMovementMode : uint8_t {
    InHouse,
    Undecided,
    Scatter,
    Chase,
    Frightened,
    GoingToHouse
};

constexpr bool isScatterOrChaseGroup(GhostMovementMode mode) {
    return mode == GhostMovementMode::Undecided || mode == GhostMovementMode::Scatter ||
           mode == GhostMovementMode::Chase;
}

constexpr const char* ghostNicknameToString(GhostNickname nickname) {
    switch (nickname) {
    case GhostNickname::Blinky:
        return "Blinky";
    case GhostNickname::Pinky:
        return "Pinky";
    case GhostNickname::Inky:
        return "Inky";
    case GhostNickname::Clyde:
        return "Clyde";
    }
    return "Unknown";
}

constexpr const char* ghostStateToString(GhostState state) {
    switch (state) {
    case GhostState::Normal:
        return "Normal";
    case GhostState::Frightened:
        return "Frightened";
    case GhostState::Eyes:
        return "Eyes";
    }
    return "Unknown";
}

constexpr const char* movementModeToString(GhostMovementMode mode) {
    switch (mode) {
    case GhostMovementMode::InHouse:
        return "InHouse";
    case GhostMovementMode::Undecided:
        return "Undecided";
    case GhostMovementMode::Scatter:
        return "Scatter";
    case GhostMovementMode::Chase:
        return "Chase";
    case GhostMovementMode::Frightened:
        return "Frightened";
    case GhostMovementMode::GoingToHouse:
        return "GoingToHouse";
    }
    return "Unknown";
}

// Stream operators for Boost.Test
inline std::ostream& operator<<(std::ostream& os, GhostNickname nickname) {
    return os << ghostNicknameToString(nickname);
}

inline std::ostream& operator<<(std::ostream& os, GhostState state) {
    return os << ghostStateToString(state);
}

inline std::ostream& operator<<(std::ostream& os, GhostMovementMode mode) {
    return os << movementModeToString(mode);
}

#endif // GHOST_TYPES_HPP
