/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/ghosts/Inky.hpp"
#include "entities/PlayerActor.hpp"

using namespace PhantomMaze;

Inky::Inky(PlayerStats &playerStats, const Maze &maze,
           const PlayerActor &player, const Ghost &blinky)
    : Ghost(GhostNickname::Inky, playerStats, maze, player,
            Vector2D(11.5f, 14.0f), Direction::Up),
      m_blinky(blinky) {}

CellIndex Inky::getChaseTarget() const {
  const PlayerActor &player = getPlayer();
  const CellIndex ahead = player.getTile().getIndex() +
                          directionToCellOffset(player.getFacing()) * CELLS_AHEAD;
  return ahead * 2 - m_blinky.getTile().getIndex();
}
