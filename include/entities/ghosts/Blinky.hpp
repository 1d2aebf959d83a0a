/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BLINKY_HPP
#define BLINKY_HPP

#include "entities/ghosts/Ghost.hpp"

/**
 * @brief The red ghost. Starts outside the house and chases the player's
 * own cell. Speeds up ("Cruise Elroy") as the dots run out.
 */
class Blinky : public Ghost {
public:
  static constexpr PhantomMaze::CellIndex SCATTER_TARGET{25, -3};

  Blinky(PlayerStats &playerStats, const PhantomMaze::Maze &maze,
         const PlayerActor &player);

  SDL_Color getColor() const override { return {255, 0, 0, 255}; }
  PhantomMaze::CellIndex getScatterTarget() const override { return SCATTER_TARGET; }
  PhantomMaze::CellIndex getChaseTarget() const override;

protected:
  float getNormalGhostSpeedPercent() const override;
};

#endif // BLINKY_HPP
