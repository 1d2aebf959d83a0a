/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/ghosts/GhostScatterMover.hpp"
#include "entities/ghosts/Ghost.hpp"

GhostScatterMover::GhostScatterMover(Ghost &ghost, const PhantomMaze::Maze &maze)
    : GhostMover(ghost, maze, GhostMovementMode::Scatter) {}

PhantomMaze::CellIndex GhostScatterMover::computeTargetCell() {
  return m_ghost.getScatterTarget();
}
