/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PLAYER_ACTOR_HPP
#define PLAYER_ACTOR_HPP

#include "world/Directions.hpp"
#include "world/Tile.hpp"

/**
 * @brief Read-only view of the player that ghosts chase.
 *
 * Ghosts only need the player's tile (for collisions and chase targets) and
 * the direction it faces (Pinky and Inky aim ahead of the player).
 */
class PlayerActor {
public:
    virtual ~PlayerActor() = default;

    virtual const PhantomMaze::Tile& getTile() const = 0;
    virtual PhantomMaze::Direction getFacing() const = 0;
};

#endif // PLAYER_ACTOR_HPP
