/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/ghosts/GhostEyesBackToHouseMover.hpp"
#include "core/Logger.hpp"
#include "entities/ghosts/Ghost.hpp"
#include "managers/EventManager.hpp"
#include <format>

using namespace PhantomMaze;

GhostEyesBackToHouseMover::GhostEyesBackToHouseMover(Ghost &ghost,
                                                     const Maze &maze)
    : GhostMover(ghost, maze, GhostMovementMode::GoingToHouse) {
  m_targetCell = maze.getHouseEntranceCell();
}

CellIndex GhostEyesBackToHouseMover::computeTargetCell() {
  return m_maze.getHouseEntranceCell();
}

// The entrance is the pair of cells above the door, either side of the exit
bool GhostEyesBackToHouseMover::reachedEntrance() const {
  const Tile &tile = m_ghost.getTile();
  if (!tile.isInCenter()) {
    return false;
  }

  const CellIndex entrance = m_maze.getHouseEntranceCell();
  const CellIndex cell = tile.getIndex();
  const CellIndex exitCell = CellIndex::fromPosition(m_maze.getHouseExitPoint());
  return cell.y == entrance.y && (cell.x == entrance.x || cell.x == exitCell.x);
}

void GhostEyesBackToHouseMover::update([[maybe_unused]] float deltaTime) {
  if (m_phase == Phase::Travel) {
    m_targetCell = computeTargetCell();
    if (!reachedEntrance()) {
      stepThroughMaze();
      return;
    }
    m_phase = Phase::Align;
  }

  if (m_phase == Phase::Align) {
    if (!moveTowards(m_maze.getHouseExitPoint())) {
      return;
    }
    m_phase = Phase::Descend;
  }

  if (m_phase == Phase::Descend) {
    if (!moveTowards(m_maze.getHouseCenterPoint())) {
      return;
    }
    m_phase = Phase::Arrived;
    m_ghost.setDirection(Direction::Up);
    MOVER_DEBUG(std::format("{} eyes are back in the house", ghostNicknameToString(m_ghost.getNickname())));
    EventManager::Instance().triggerGhostInsideHouse(m_ghost);
    m_ghost.setMovementMode(GhostMovementMode::InHouse);
  }
}
