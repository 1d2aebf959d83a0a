/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PINKY_HPP
#define PINKY_HPP

#include "entities/ghosts/Ghost.hpp"

// The pink ghost; ambushes four cells ahead of the player
class Pinky : public Ghost {
public:
  static constexpr PhantomMaze::CellIndex SCATTER_TARGET{2, -3};
  static constexpr int CELLS_AHEAD = 4;

  Pinky(PlayerStats &playerStats, const PhantomMaze::Maze &maze,
        const PlayerActor &player);

  SDL_Color getColor() const override { return {255, 184, 255, 255}; }
  PhantomMaze::CellIndex getScatterTarget() const override { return SCATTER_TARGET; }
  PhantomMaze::CellIndex getChaseTarget() const override;
};

#endif // PINKY_HPP
