/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INKY_HPP
#define INKY_HPP

#include "entities/ghosts/Ghost.hpp"

/**
 * @brief The cyan ghost. Its chase target is the point two cells ahead of
 * the player, mirrored away from Blinky.
 */
class Inky : public Ghost {
public:
  static constexpr PhantomMaze::CellIndex SCATTER_TARGET{27, 31};
  static constexpr int CELLS_AHEAD = 2;

  Inky(PlayerStats &playerStats, const PhantomMaze::Maze &maze,
       const PlayerActor &player, const Ghost &blinky);

  SDL_Color getColor() const override { return {0, 255, 255, 255}; }
  PhantomMaze::CellIndex getScatterTarget() const override { return SCATTER_TARGET; }
  PhantomMaze::CellIndex getChaseTarget() const override;

private:
  const Ghost &m_blinky;
};

#endif // INKY_HPP
