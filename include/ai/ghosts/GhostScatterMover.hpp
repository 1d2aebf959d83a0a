/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GHOST_SCATTER_MOVER_HPP
#define GHOST_SCATTER_MOVER_HPP

#include "ai/ghosts/GhostMover.hpp"

// Heads for the ghost's home corner
class GhostScatterMover : public GhostMover {
public:
  GhostScatterMover(Ghost &ghost, const PhantomMaze::Maze &maze);

  std::string getName() const override { return "Scatter"; }

protected:
  PhantomMaze::CellIndex computeTargetCell() override;
};

#endif // GHOST_SCATTER_MOVER_HPP
