/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/ghosts/GhostInsideHouseMover.hpp"
#include "core/Logger.hpp"
#include "entities/ghosts/Ghost.hpp"
#include "gameplay/GhostHouseDoor.hpp"
#include <format>

using namespace PhantomMaze;

GhostInsideHouseMover::GhostInsideHouseMover(Ghost &ghost, const Maze &maze,
                                             GhostHouseDoor &door)
    : GhostMover(ghost, maze, GhostMovementMode::InHouse), m_door(door) {
  m_targetCell = CellIndex::fromPosition(maze.getHouseExitPoint());
}

CellIndex GhostInsideHouseMover::computeTargetCell() {
  return CellIndex::fromPosition(m_maze.getHouseExitPoint());
}

void GhostInsideHouseMover::update([[maybe_unused]] float deltaTime) {
  m_targetCell = computeTargetCell();
  const Vector2D exitPoint = m_maze.getHouseExitPoint();

  if (m_phase == Phase::Bobbing) {
    if (!m_door.canGhostLeave(m_ghost.getNickname())) {
      bob();
      return;
    }
    m_phase = Phase::ToExitColumn;
  }

  if (m_phase == Phase::ToExitColumn) {
    if (!moveTowards(Vector2D(exitPoint.getX(), m_ghost.getPosition().getY()))) {
      return;
    }
    m_phase = Phase::Rising;
  }

  if (m_phase == Phase::Rising) {
    if (!moveTowards(exitPoint)) {
      return;
    }
    m_phase = Phase::Left;
    m_ghost.setDirection(Direction::Left);
    m_ghost.setMovementMode(GhostMovementMode::Undecided);
    MOVER_DEBUG(std::format("{} left the house", ghostNicknameToString(m_ghost.getNickname())));
  }
}

void GhostInsideHouseMover::bob() {
  const float centerY = m_maze.getHouseCenterPoint().getY();
  const float y = m_ghost.getPosition().getY();

  Direction direction = m_ghost.getDirection().current;
  if (!isVertical(direction)) {
    direction = Direction::Up;
  }

  if (direction == Direction::Up && y <= centerY - BOB_RANGE) {
    direction = Direction::Down;
  } else if (direction == Direction::Down && y >= centerY + BOB_RANGE) {
    direction = Direction::Up;
  }

  m_ghost.setDirection(direction);
  m_ghost.moveForwards();
}
