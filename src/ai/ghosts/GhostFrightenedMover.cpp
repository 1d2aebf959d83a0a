/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/ghosts/GhostFrightenedMover.hpp"
#include "entities/ghosts/Ghost.hpp"

GhostFrightenedMover::GhostFrightenedMover(Ghost &ghost,
                                           const PhantomMaze::Maze &maze)
    : GhostMover(ghost, maze, GhostMovementMode::Frightened) {}

std::mt19937 &GhostFrightenedMover::getSharedRNG() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  return rng;
}

// No real target: report the cell straight ahead
PhantomMaze::CellIndex GhostFrightenedMover::computeTargetCell() {
  return m_ghost.getTile().getIndex() +
         PhantomMaze::directionToCellOffset(m_ghost.getDirection().current);
}

PhantomMaze::Direction
GhostFrightenedMover::chooseDirection(const DirectionCandidates &candidates) {
  std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
  return candidates[pick(getSharedRNG())];
}
