/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/ghosts/GhostChaseMover.hpp"
#include "entities/ghosts/Ghost.hpp"

GhostChaseMover::GhostChaseMover(Ghost &ghost, const PhantomMaze::Maze &maze)
    : GhostMover(ghost, maze, GhostMovementMode::Chase) {}

PhantomMaze::CellIndex GhostChaseMover::computeTargetCell() {
  return m_ghost.getChaseTarget();
}
