/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/ghosts/Pinky.hpp"
#include "entities/PlayerActor.hpp"

using namespace PhantomMaze;

Pinky::Pinky(PlayerStats &playerStats, const Maze &maze,
             const PlayerActor &player)
    : Ghost(GhostNickname::Pinky, playerStats, maze, player,
            Vector2D(13.5f, 14.0f), Direction::Down) {}

CellIndex Pinky::getChaseTarget() const {
  const PlayerActor &player = getPlayer();
  return player.getTile().getIndex() +
         directionToCellOffset(player.getFacing()) * CELLS_AHEAD;
}
