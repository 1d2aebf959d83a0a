/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/ghosts/Clyde.hpp"
#include "entities/PlayerActor.hpp"

using namespace PhantomMaze;

Clyde::Clyde(PlayerStats &playerStats, const Maze &maze,
             const PlayerActor &player)
    : Ghost(GhostNickname::Clyde, playerStats, maze, player,
            Vector2D(15.5f, 14.0f), Direction::Up) {}

CellIndex Clyde::getChaseTarget() const {
  const CellIndex playerCell = getPlayer().getTile().getIndex();
  if (CellIndex::distanceSquared(getTile().getIndex(), playerCell) >=
      SHY_DISTANCE * SHY_DISTANCE) {
    return playerCell;
  }
  return SCATTER_TARGET;
}
