/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GHOST_INSIDE_HOUSE_MOVER_HPP
#define GHOST_INSIDE_HOUSE_MOVER_HPP

#include "ai/ghosts/GhostMover.hpp"
#include <cstdint>

class GhostHouseDoor;

/**
 * @brief Keeps a ghost bobbing inside the house until the door lets it out,
 * then walks it to the exit column and up through the door.
 *
 * On the exit point the ghost faces Left and its mode becomes Undecided, so
 * the scatter/chase timer decides what it does next.
 */
class GhostInsideHouseMover : public GhostMover {
public:
  enum class Phase : uint8_t { Bobbing, ToExitColumn, Rising, Left };

  // Bob this far above and below the house center, in pixels
  static constexpr float BOB_RANGE = 4.0f;

  GhostInsideHouseMover(Ghost &ghost, const PhantomMaze::Maze &maze,
                        GhostHouseDoor &door);

  void update(float deltaTime) override;
  std::string getName() const override { return "InsideHouse"; }

  Phase getPhase() const { return m_phase; }

protected:
  PhantomMaze::CellIndex computeTargetCell() override;

private:
  void bob();

  GhostHouseDoor &m_door;
  Phase m_phase{Phase::Bobbing};
};

#endif // GHOST_INSIDE_HOUSE_MOVER_HPP
