/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/ghosts/GhostMover.hpp"
#include "entities/ghosts/Ghost.hpp"
#include <cmath>
#include <limits>

using namespace PhantomMaze;

GhostMover::GhostMover(Ghost &ghost, const Maze &maze,
                       GhostMovementMode movementMode)
    : m_ghost(ghost), m_maze(maze), m_movementMode(movementMode) {}

void GhostMover::update([[maybe_unused]] float deltaTime) {
  m_targetCell = computeTargetCell();
  stepThroughMaze();
}

void GhostMover::keepDirectionForCurrentCell() {
  m_lastDecisionCell = m_ghost.getTile().getIndex();
}

Direction GhostMover::chooseDirection(const DirectionCandidates &candidates) {
  return directionTowards(candidates, m_targetCell);
}

void GhostMover::stepThroughMaze() {
  const Tile &tile = m_ghost.getTile();

  if (tile.isInCenter()) {
    const CellIndex cell = tile.getIndex();
    const Direction current = m_ghost.getDirection().current;
    const bool blocked = !canMove(current);

    if (blocked || m_lastDecisionCell != cell) {
      const DirectionCandidates candidates = availableDirections();
      if (!candidates.empty()) {
        const Direction chosen = chooseDirection(candidates);
        if (chosen != current) {
          // Turn exactly on the lane
          const Vector2D center = tile.getCenter();
          m_ghost.updatePositionFromMovement(center);
        }
        m_ghost.setDirection(chosen);
      }
      m_lastDecisionCell = cell;
    }

    if (!canMove(m_ghost.getDirection().current)) {
      return;
    }
  }

  m_ghost.moveForwards();
}

bool GhostMover::canMove(Direction direction) const {
  if (direction == Direction::None) {
    return false;
  }
  return m_maze.isWalkable(
      m_ghost.getTile().nextTileWrapped(direction).getIndex());
}

DirectionCandidates GhostMover::availableDirections() const {
  DirectionCandidates candidates;
  for (Direction direction : DIRECTION_PRIORITY) {
    if (canMove(direction)) {
      candidates.push_back(direction);
    }
  }

  const Direction reverse = reverseDirection(m_ghost.getDirection().current);
  if (candidates.size() > 1) {
    for (auto it = candidates.begin(); it != candidates.end(); ++it) {
      if (*it == reverse) {
        candidates.erase(it);
        break;
      }
    }
  }
  return candidates;
}

Direction GhostMover::directionTowards(const DirectionCandidates &candidates,
                                       const CellIndex &target) const {
  Direction best = Direction::None;
  int bestDistance = std::numeric_limits<int>::max();

  // Candidates arrive in tie-break order, so strict < keeps the first
  for (Direction direction : candidates) {
    const CellIndex next =
        m_ghost.getTile().nextTileWrapped(direction).getIndex();
    const int distance = CellIndex::distanceSquared(next, target);
    if (distance < bestDistance) {
      bestDistance = distance;
      best = direction;
    }
  }
  return best;
}

bool GhostMover::moveTowards(const Vector2D &point) {
  const Vector2D position = m_ghost.getPosition();
  const Vector2D delta = point - position;
  const float distance = delta.length();
  const float speed = m_ghost.getSpeed();

  if (distance <= speed) {
    m_ghost.updatePositionFromMovement(point);
    return true;
  }

  if (std::fabs(delta.getX()) >= std::fabs(delta.getY())) {
    m_ghost.setDirection(delta.getX() < 0.0f ? Direction::Left
                                             : Direction::Right);
  } else {
    m_ghost.setDirection(delta.getY() < 0.0f ? Direction::Up : Direction::Down);
  }

  m_ghost.updatePositionFromMovement(position + delta * (speed / distance));
  return false;
}
