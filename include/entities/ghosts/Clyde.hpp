/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CLYDE_HPP
#define CLYDE_HPP

#include "entities/ghosts/Ghost.hpp"

/**
 * @brief The orange ghost. Chases the player while at least eight cells
 * away, otherwise heads back to its corner.
 */
class Clyde : public Ghost {
public:
  static constexpr PhantomMaze::CellIndex SCATTER_TARGET{0, 31};
  static constexpr int SHY_DISTANCE = 8;

  Clyde(PlayerStats &playerStats, const PhantomMaze::Maze &maze,
        const PlayerActor &player);

  SDL_Color getColor() const override { return {255, 184, 82, 255}; }
  PhantomMaze::CellIndex getScatterTarget() const override { return SCATTER_TARGET; }
  PhantomMaze::CellIndex getChaseTarget() const override;
};

#endif // CLYDE_HPP
