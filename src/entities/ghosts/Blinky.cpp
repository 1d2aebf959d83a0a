/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/ghosts/Blinky.hpp"
#include "entities/PlayerActor.hpp"
#include "gameplay/PlayerStats.hpp"

using namespace PhantomMaze;

Blinky::Blinky(PlayerStats &playerStats, const Maze &maze,
               const PlayerActor &player)
    : Ghost(GhostNickname::Blinky, playerStats, maze, player,
            Vector2D(13.5f, 11.0f), Direction::Left) {}

CellIndex Blinky::getChaseTarget() const {
  return getPlayer().getTile().getIndex();
}

float Blinky::getNormalGhostSpeedPercent() const {
  const LevelStats &levelStats = getPlayerStats().getLevelStats();
  const LevelProps &props = levelStats.getLevelProps();
  const int dotsLeft = levelStats.getDotsLeft();

  if (dotsLeft <= props.elroy2DotsLeft) {
    return props.elroy2SpeedPc;
  }
  if (dotsLeft <= props.elroy1DotsLeft) {
    return props.elroy1SpeedPc;
  }
  return props.ghostSpeedPc;
}
