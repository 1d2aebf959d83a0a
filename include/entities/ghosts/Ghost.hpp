/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GHOST_HPP
#define GHOST_HPP

#include "entities/Entity.hpp"
#include "entities/ghosts/GhostTypes.hpp"
#include "utils/Vector2D.hpp"
#include "world/CellIndex.hpp"
#include "world/Directions.hpp"
#include "world/Maze.hpp"
#include "world/Tile.hpp"
#include <SDL3/SDL_pixels.h>
#include <SDL3/SDL_render.h>
#include <functional>
#include <memory>

class GhostMover;
class PlayerActor;
class PlayerStats;

/**
 * @brief One ghost and its state machine.
 *
 * A ghost combines a vulnerability state (Normal, Frightened, Eyes) with a
 * movement mode and owns exactly one mover for that mode. The mover is
 * replaced whenever the required mode changes, never edited in place.
 *
 * Per tick the ghost re-centres in its lane, checks the player's cell,
 * runs the action armed for the next cell center, picks its mover and lets
 * the mover take one step. Personalities supply the scatter corner, the
 * chase target and the colour.
 */
class Ghost : public Entity {
public:
  using OnCenterAction = std::function<void(Ghost &)>;

  static constexpr float BASE_SPEED = 1.25f;
  static constexpr float IN_HOUSE_SPEED = 0.25f;
  static constexpr float EYES_SPEED = 2.0f;

  /**
   * @param spawnCell Spawn position in cells, halves allowed
   * @param spawnDirection Facing after every reset()
   */
  Ghost(GhostNickname nickname, PlayerStats &playerStats,
        const PhantomMaze::Maze &maze, const PlayerActor &player,
        const Vector2D &spawnCell, PhantomMaze::Direction spawnDirection);
  ~Ghost() override;

  Ghost(const Ghost &) = delete;
  Ghost &operator=(const Ghost &) = delete;

  void update(float deltaTime) override;
  void render(SDL_Renderer *renderer, float cameraX, float cameraY,
              float interpolationAlpha = 1.0f) override;
  void clean() override;

  // Back to the spawn point, Normal and InHouse, without a mover
  virtual void reset();

  /**
   * @brief Frightens the ghost. Ghosts out hunting turn around and switch
   * to the frightened mover once they reach the next cell center.
   */
  void powerPillEaten();

  void setPosition(const Vector2D &position) override;
  void updatePositionFromMovement(const Vector2D &position) override;

  // Pixels per tick for the current state, mode and cell
  float getSpeed() const;

  /**
   * @brief One tick of speed along the current direction.
   *
   * A step that would cross the cell center stops on it so the center is
   * seen at the start of the next tick. The part of the step left over is
   * added to the next step, keeping the distance covered at getSpeed() per
   * tick.
   */
  void moveForwards();

  // Distance owed to the next step after stopping on a cell center
  float getCarriedDistance() const { return m_carriedDistance; }

  void setMovementMode(GhostMovementMode mode) { m_movementMode = mode; }
  void setDirection(PhantomMaze::Direction direction) { m_direction.update(direction); }

  void stopMoving() { m_moving = false; }
  void startMoving() { m_moving = true; }
  bool isMoving() const { return m_moving; }

  GhostNickname getNickname() const { return m_nickname; }
  GhostState getState() const { return m_state; }
  GhostMovementMode getMovementMode() const { return m_movementMode; }
  const PhantomMaze::Tile &getTile() const { return m_tile; }
  const PhantomMaze::DirectionInfo &getDirection() const { return m_direction; }
  const GhostMover *getMover() const { return m_mover.get(); }
  const Vector2D &getSpawnCell() const { return m_spawnCell; }
  PhantomMaze::Direction getSpawnDirection() const { return m_spawnDirection; }

  virtual SDL_Color getColor() const = 0;
  virtual PhantomMaze::CellIndex getScatterTarget() const = 0;
  virtual PhantomMaze::CellIndex getChaseTarget() const = 0;

protected:
  virtual float getNormalGhostSpeedPercent() const;

  const PlayerActor &getPlayer() const { return m_player; }
  const PlayerStats &getPlayerStats() const { return m_playerStats; }

private:
  void recenterInLane();
  void collisionDetection();
  void runOnCenterAction();
  void setMoverAndMode();
  void checkFrightSession();
  std::unique_ptr<GhostMover> createMover(GhostMovementMode mode);
  bool isPlayerInvincible() const;

  static void doNothing(Ghost &) {}
  static void reverseAndFrighten(Ghost &ghost);

  const GhostNickname m_nickname;
  PlayerStats &m_playerStats;
  const PhantomMaze::Maze &m_maze;
  const PlayerActor &m_player;
  const Vector2D m_spawnCell;
  const PhantomMaze::Direction m_spawnDirection;

  PhantomMaze::Tile m_tile;
  PhantomMaze::DirectionInfo m_direction{};
  GhostState m_state{GhostState::Normal};
  GhostMovementMode m_movementMode{GhostMovementMode::InHouse};
  bool m_moving{false};
  float m_carriedDistance{0.0f};

  // Empty until the first reset(); a no-op once it has fired
  OnCenterAction m_onCenterAction{};
  std::unique_ptr<GhostMover> m_mover;
};

#endif // GHOST_HPP
