/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GHOST_EYES_BACK_TO_HOUSE_MOVER_HPP
#define GHOST_EYES_BACK_TO_HOUSE_MOVER_HPP

#include "ai/ghosts/GhostMover.hpp"
#include <cstdint>

/**
 * @brief Takes the eyes of an eaten ghost home.
 *
 * The eyes walk the maze to the cell above the house door, line up with the
 * door, drop to the house center and publish GhostInsideHouseEvent. The
 * ghost's mode then becomes InHouse.
 */
class GhostEyesBackToHouseMover : public GhostMover {
public:
  enum class Phase : uint8_t { Travel, Align, Descend, Arrived };

  GhostEyesBackToHouseMover(Ghost &ghost, const PhantomMaze::Maze &maze);

  void update(float deltaTime) override;
  std::string getName() const override { return "EyesBackToHouse"; }

  Phase getPhase() const { return m_phase; }

protected:
  PhantomMaze::CellIndex computeTargetCell() override;

private:
  bool reachedEntrance() const;

  Phase m_phase{Phase::Travel};
};

#endif // GHOST_EYES_BACK_TO_HOUSE_MOVER_HPP
