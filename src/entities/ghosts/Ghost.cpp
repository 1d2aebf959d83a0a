/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/ghosts/Ghost.hpp"
#include "ai/ghosts/GhostChaseMover.hpp"
#include "ai/ghosts/GhostEyesBackToHouseMover.hpp"
#include "ai/ghosts/GhostFrightenedMover.hpp"
#include "ai/ghosts/GhostInsideHouseMover.hpp"
#include "ai/ghosts/GhostMoverTable.hpp"
#include "ai/ghosts/GhostScatterMover.hpp"
#include "core/Logger.hpp"
#include "entities/PlayerActor.hpp"
#include "gameplay/PlayerStats.hpp"
#include "managers/EventManager.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

using namespace PhantomMaze;

namespace {
constexpr float BODY_SIZE = 14.0f;
constexpr float EYE_SIZE = 3.0f;
constexpr float SKIRT_HEIGHT = 3.0f;
constexpr int SKIRT_FRAMES = 2;
constexpr int SKIRT_FRAME_MS = 133; // eight ticks per wobble
constexpr SDL_Color FRIGHTENED_COLOR{33, 33, 255, 255};
constexpr SDL_Color FLASH_COLOR{222, 222, 255, 255};
constexpr SDL_Color EYE_COLOR{255, 255, 255, 255};

// Moves value towards target by at most maxStep
float approach(float value, float target, float maxStep) {
  if (value < target) {
    return std::min(value + maxStep, target);
  }
  return std::max(value - maxStep, target);
}
} // namespace

Ghost::Ghost(GhostNickname nickname, PlayerStats &playerStats,
             const Maze &maze, const PlayerActor &player,
             const Vector2D &spawnCell, Direction spawnDirection)
    : m_nickname(nickname), m_playerStats(playerStats), m_maze(maze),
      m_player(player), m_spawnCell(spawnCell),
      m_spawnDirection(spawnDirection), m_tile(maze.getWidthInCells()) {
  m_numFrames = SKIRT_FRAMES;
  m_animSpeed = SKIRT_FRAME_MS;
}

Ghost::~Ghost() = default;

void Ghost::reset() {
  m_state = GhostState::Normal;
  m_movementMode = GhostMovementMode::InHouse;
  m_onCenterAction = doNothing;
  m_mover.reset();
  m_carriedDistance = 0.0f;

  setPosition(Tile::toCenterCanvas(m_spawnCell));
  m_direction.update(m_spawnDirection);
  m_moving = true;

  GHOST_DEBUG(std::format("{} reset facing {}", ghostNicknameToString(m_nickname),
                          directionToString(m_spawnDirection)));
}

void Ghost::setPosition(const Vector2D &position) {
  m_tile.updateWithPosition(position);
  Entity::setPosition(m_tile.getPosition());
}

void Ghost::updatePositionFromMovement(const Vector2D &position) {
  m_tile.updateWithPosition(position);
  Entity::updatePositionFromMovement(m_tile.getPosition());
}

void Ghost::update(float deltaTime) {
  storePositionForInterpolation();
  updateAnimation(deltaTime);

  if (!m_moving) {
    return;
  }

  recenterInLane();
  collisionDetection();
  runOnCenterAction();
  setMoverAndMode();

  if (!m_mover) {
    const std::string message = std::format(
        "{} has no mover for mode {}", ghostNicknameToString(m_nickname),
        movementModeToString(m_movementMode));
    GHOST_CRITICAL(message);
    throw std::logic_error(message);
  }
  m_mover->update(deltaTime);

  checkFrightSession();
}

void Ghost::recenterInLane() {
  if (m_movementMode != GhostMovementMode::Scatter &&
      m_movementMode != GhostMovementMode::Chase) {
    return;
  }

  const float speed = getSpeed();
  const Vector2D center = m_tile.getCenter();
  Vector2D position = m_tile.getPosition();

  if (isVertical(m_direction.current)) {
    position.setX(approach(position.getX(), center.getX(), speed));
  } else if (isHorizontal(m_direction.current)) {
    position.setY(approach(position.getY(), center.getY(), speed));
  } else {
    return;
  }
  updatePositionFromMovement(position);
}

void Ghost::collisionDetection() {
  if (m_tile.getIndex() != m_player.getTile().getIndex()) {
    return;
  }

  switch (m_state) {
  case GhostState::Normal:
    if (isPlayerInvincible()) {
      GHOST_DEBUG(std::format("{} touched the invincible player",
                              ghostNicknameToString(m_nickname)));
      return;
    }
    EventManager::Instance().triggerPlayerEaten(m_nickname);
    break;
  case GhostState::Frightened:
    EventManager::Instance().triggerGhostEaten(*this);
    m_state = GhostState::Eyes;
    m_movementMode = GhostMovementMode::GoingToHouse;
    GHOST_INFO(std::format("{} eaten", ghostNicknameToString(m_nickname)));
    break;
  case GhostState::Eyes:
    break;
  }
}

void Ghost::runOnCenterAction() {
  if (!m_tile.isInCenter()) {
    return;
  }

  if (!m_onCenterAction) {
    const std::string message =
        std::format("{} reached a cell center with no action armed; reset() "
                    "was never called",
                    ghostNicknameToString(m_nickname));
    GHOST_CRITICAL(message);
    throw std::logic_error(message);
  }

  OnCenterAction action = std::move(m_onCenterAction);
  m_onCenterAction = doNothing;
  action(*this);
}

void Ghost::setMoverAndMode() {
  const GhostMovementMode conductorMode =
      m_playerStats.getGhostMoveConductor().getCurrentMode();

  std::optional<GhostMovementMode> activeMover;
  if (m_mover) {
    activeMover = m_mover->getMovementMode();
  }

  const GhostMovementMode required =
      selectMoverMode(m_state, m_movementMode, conductorMode, activeMover);

  if (isScatterOrChaseGroup(m_movementMode)) {
    m_movementMode = conductorMode;
  }

  if (activeMover == required) {
    return;
  }

  if (required == GhostMovementMode::InHouse) {
    m_state = GhostState::Normal;
  }
  m_mover = createMover(required);
  m_carriedDistance = 0.0f;
  GHOST_DEBUG(std::format("{} now uses the {} mover",
                          ghostNicknameToString(m_nickname),
                          m_mover->getName()));
}

std::unique_ptr<GhostMover> Ghost::createMover(GhostMovementMode mode) {
  switch (mode) {
  case GhostMovementMode::InHouse:
    return std::make_unique<GhostInsideHouseMover>(
        *this, m_maze, m_playerStats.getGhostHouseDoor());
  case GhostMovementMode::Scatter:
    return std::make_unique<GhostScatterMover>(*this, m_maze);
  case GhostMovementMode::Chase:
    return std::make_unique<GhostChaseMover>(*this, m_maze);
  case GhostMovementMode::Frightened:
    return std::make_unique<GhostFrightenedMover>(*this, m_maze);
  case GhostMovementMode::GoingToHouse:
    return std::make_unique<GhostEyesBackToHouseMover>(*this, m_maze);
  case GhostMovementMode::Undecided:
    break;
  }

  const std::string message =
      std::format("No mover exists for mode {}", movementModeToString(mode));
  GHOST_CRITICAL(message);
  throw std::logic_error(message);
}

void Ghost::checkFrightSession() {
  if (m_state != GhostState::Frightened) {
    return;
  }

  const GhostFrightSession *session = m_playerStats.getFrightSession();
  if (!session) {
    const std::string message =
        std::format("{} is frightened without a fright session",
                    ghostNicknameToString(m_nickname));
    GHOST_CRITICAL(message);
    throw std::logic_error(message);
  }

  if (session->isFinished()) {
    m_state = GhostState::Normal;
    GHOST_DEBUG(std::format("{} recovered", ghostNicknameToString(m_nickname)));
  }
}

void Ghost::powerPillEaten() {
  if (m_state == GhostState::Eyes) {
    return;
  }

  m_state = GhostState::Frightened;
  if (m_movementMode == GhostMovementMode::Chase ||
      m_movementMode == GhostMovementMode::Scatter) {
    m_onCenterAction = reverseAndFrighten;
  }
}

void Ghost::reverseAndFrighten(Ghost &ghost) {
  // Eaten before reaching the center
  if (ghost.m_state == GhostState::Eyes) {
    return;
  }

  ghost.m_direction.update(reverseDirection(ghost.m_direction.current));

  if (ghost.m_state == GhostState::Frightened) {
    ghost.m_mover = ghost.createMover(GhostMovementMode::Frightened);
    ghost.m_mover->keepDirectionForCurrentCell();
  }
}

float Ghost::getSpeed() const {
  if (m_movementMode == GhostMovementMode::InHouse) {
    return IN_HOUSE_SPEED;
  }
  if (m_state == GhostState::Eyes) {
    return EYES_SPEED;
  }

  const LevelProps &props = m_playerStats.getLevelStats().getLevelProps();
  if (m_state == GhostState::Frightened) {
    return BASE_SPEED * props.frightGhostSpeedPc / 100.0f;
  }
  if (m_maze.isTunnelCell(m_tile.getIndex())) {
    return BASE_SPEED * props.ghostTunnelSpeedPc / 100.0f;
  }
  return BASE_SPEED * getNormalGhostSpeedPercent() / 100.0f;
}

float Ghost::getNormalGhostSpeedPercent() const {
  return m_playerStats.getLevelStats().getLevelProps().ghostSpeedPc;
}

void Ghost::moveForwards() {
  const Direction direction = m_direction.current;
  if (direction == Direction::None) {
    return;
  }

  const float distance = getSpeed() + m_carriedDistance;
  m_carriedDistance = 0.0f;
  const Vector2D position = m_tile.getPosition();
  const Vector2D center = m_tile.getCenter();
  const Vector2D step = directionToVector(direction);

  // Distance to the cell center measured along the direction of travel
  const float ahead = isVertical(direction)
                          ? (center.getY() - position.getY()) * step.getY()
                          : (center.getX() - position.getX()) * step.getX();

  if (ahead > 0.0f && ahead <= distance) {
    Vector2D onCenter = position;
    if (isVertical(direction)) {
      onCenter.setY(center.getY());
    } else {
      onCenter.setX(center.getX());
    }
    updatePositionFromMovement(onCenter);
    m_carriedDistance = distance - ahead;
    return;
  }

  updatePositionFromMovement(position + step * distance);
}

bool Ghost::isPlayerInvincible() const {
  return SettingsManager::Instance().isCheatEnabled("player_invincible");
}

void Ghost::render(SDL_Renderer *renderer, float cameraX, float cameraY,
                   float interpolationAlpha) {
  if (!renderer) {
    return;
  }

  const Vector2D position = getInterpolatedPosition(interpolationAlpha);
  const float left = position.getX() - cameraX - BODY_SIZE / 2.0f;
  const float top = position.getY() - cameraY - BODY_SIZE / 2.0f;

  if (m_state != GhostState::Eyes) {
    SDL_Color body = getColor();
    if (m_state == GhostState::Frightened) {
      body = FRIGHTENED_COLOR;
      const GhostFrightSession *session = m_playerStats.getFrightSession();
      if (session && session->isFlashing() &&
          std::fmod(session->getTimeLeft(), GhostFrightSession::FLASH_DURATION) <
              GhostFrightSession::FLASH_DURATION / 2.0f) {
        body = FLASH_COLOR;
      }
    }
    SDL_SetRenderDrawColor(renderer, body.r, body.g, body.b, body.a);
    SDL_FRect bodyRect = {left, top, BODY_SIZE, BODY_SIZE - SKIRT_HEIGHT};
    SDL_RenderFillRect(renderer, &bodyRect);

    // The skirt's feet shift by one foot width between the two frames
    const float footWidth = BODY_SIZE / 7.0f;
    const float firstFoot = m_currentFrame == 0 ? 0.0f : footWidth;
    for (float footX = firstFoot; footX + footWidth <= BODY_SIZE + 0.01f;
         footX += 2.0f * footWidth) {
      SDL_FRect foot = {left + footX, top + BODY_SIZE - SKIRT_HEIGHT,
                        footWidth, SKIRT_HEIGHT};
      SDL_RenderFillRect(renderer, &foot);
    }
  }

  // Eyes look the way the ghost is heading
  const Vector2D look = directionToVector(m_direction.current);
  SDL_SetRenderDrawColor(renderer, EYE_COLOR.r, EYE_COLOR.g, EYE_COLOR.b,
                         EYE_COLOR.a);
  for (float eyeX : {left + 3.0f, left + BODY_SIZE - 3.0f - EYE_SIZE}) {
    SDL_FRect eye = {eyeX + look.getX(), top + 4.0f + look.getY(), EYE_SIZE,
                     EYE_SIZE};
    SDL_RenderFillRect(renderer, &eye);
  }

  if (!m_mover ||
      !SettingsManager::Instance().get<bool>("debug", "show_ghost_targets",
                                             false)) {
    return;
  }

  const Vector2D target =
      Tile::toCenterCanvas(m_mover->getTargetCell().toVector());
  const SDL_Color color = getColor();

  SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
  SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, 255);
  SDL_RenderLine(renderer, position.getX() - cameraX, position.getY() - cameraY,
                 target.getX() - cameraX, target.getY() - cameraY);

  SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, 64);
  SDL_FRect marker = {target.getX() - cameraX - CELL_SIZE / 2.0f,
                      target.getY() - cameraY - CELL_SIZE / 2.0f,
                      static_cast<float>(CELL_SIZE),
                      static_cast<float>(CELL_SIZE)};
  SDL_RenderFillRect(renderer, &marker);
}

void Ghost::clean() {
  m_mover.reset();
  m_moving = false;
}
