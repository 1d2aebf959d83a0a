/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GHOST_MANAGER_HPP
#define GHOST_MANAGER_HPP

/**
 * @file GhostManager.hpp
 * @brief Owns the four ghosts of the current player and ticks them
 *
 * Ghosts are updated one after another in the fixed order Blinky, Pinky,
 * Inky, Clyde, so Inky always reads Blinky's position from the same tick.
 */

#include "entities/ghosts/Ghost.hpp"
#include "entities/ghosts/GhostTypes.hpp"
#include "world/Maze.hpp"
#include <SDL3/SDL_render.h>
#include <array>
#include <memory>

class PlayerActor;
class PlayerStats;

class GhostManager {
public:
  GhostManager(PlayerStats &playerStats, const PhantomMaze::Maze &maze,
               const PlayerActor &player);
  ~GhostManager();

  GhostManager(const GhostManager &) = delete;
  GhostManager &operator=(const GhostManager &) = delete;

  void update(float deltaTime);
  void render(SDL_Renderer *renderer, float cameraX, float cameraY,
              float interpolationAlpha = 1.0f);

  /**
   * @brief Starts the fright session on the player stats, then frightens
   * every ghost.
   */
  void powerPillEaten();

  // All ghosts back to their spawn points, e.g. after a lost life
  void reset();

  void stopMoving();
  void clean();

  Ghost &getGhost(GhostNickname nickname);
  const Ghost &getGhost(GhostNickname nickname) const;

  size_t getGhostCount() const { return m_ghosts.size(); }

private:
  PlayerStats &m_playerStats;
  std::array<std::unique_ptr<Ghost>, 4> m_ghosts;
};

#endif // GHOST_MANAGER_HPP
