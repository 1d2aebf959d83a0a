/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GHOST_CHASE_MOVER_HPP
#define GHOST_CHASE_MOVER_HPP

#include "ai/ghosts/GhostMover.hpp"

// Heads for the cell picked by the ghost's personality
class GhostChaseMover : public GhostMover {
public:
  GhostChaseMover(Ghost &ghost, const PhantomMaze::Maze &maze);

  std::string getName() const override { return "Chase"; }

protected:
  PhantomMaze::CellIndex computeTargetCell() override;
};

#endif // GHOST_CHASE_MOVER_HPP
