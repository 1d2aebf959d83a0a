/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GHOST_FRIGHTENED_MOVER_HPP
#define GHOST_FRIGHTENED_MOVER_HPP

#include "ai/ghosts/GhostMover.hpp"
#include <random>

/**
 * @brief Wanders the maze, taking a random exit at every junction.
 *
 * Like every mover it never reverses on its own; the reversal when a power
 * pill is eaten is done by the ghost before this mover takes over.
 */
class GhostFrightenedMover : public GhostMover {
public:
  GhostFrightenedMover(Ghost &ghost, const PhantomMaze::Maze &maze);

  std::string getName() const override { return "Frightened"; }

protected:
  PhantomMaze::CellIndex computeTargetCell() override;
  PhantomMaze::Direction
  chooseDirection(const DirectionCandidates &candidates) override;

private:
  static std::mt19937 &getSharedRNG();
};

#endif // GHOST_FRIGHTENED_MOVER_HPP
