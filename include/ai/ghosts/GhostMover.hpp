/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GHOST_MOVER_HPP
#define GHOST_MOVER_HPP

#include "entities/ghosts/GhostTypes.hpp"
#include "utils/Vector2D.hpp"
#include "world/CellIndex.hpp"
#include "world/Directions.hpp"
#include "world/Maze.hpp"
#include <boost/container/small_vector.hpp>
#include <optional>
#include <string>

class Ghost;

using DirectionCandidates = boost::container::small_vector<PhantomMaze::Direction, 4>;

/**
 * @brief Movement strategy for one ghost in one movement mode.
 *
 * A mover is created by its ghost when the ghost enters a mode and is
 * discarded when the mode changes. It only moves and turns its ghost; the
 * house movers also hand the ghost its next movement mode.
 *
 * The default update() walks the maze towards getTargetCell(), choosing a
 * new direction once per cell when the ghost is centred, or straight away
 * when the way ahead is blocked.
 */
class GhostMover {
public:
  GhostMover(Ghost &ghost, const PhantomMaze::Maze &maze,
             GhostMovementMode movementMode);
  virtual ~GhostMover() = default;

  GhostMover(const GhostMover &) = delete;
  GhostMover &operator=(const GhostMover &) = delete;

  // The mode this mover was built for
  GhostMovementMode getMovementMode() const { return m_movementMode; }

  // Where the mover is heading, for the debug overlay
  PhantomMaze::CellIndex getTargetCell() const { return m_targetCell; }

  virtual std::string getName() const = 0;

  /**
   * @brief Advance the ghost by one tick.
   * @param deltaTime Seconds since the last tick
   */
  virtual void update(float deltaTime);

  /**
   * @brief Skip the decision for the cell the ghost is in, so a direction
   * that was just forced on it survives until the next cell.
   */
  void keepDirectionForCurrentCell();

protected:
  virtual PhantomMaze::CellIndex computeTargetCell() = 0;

  // Picks one of the candidates; the default heads for m_targetCell
  virtual PhantomMaze::Direction
  chooseDirection(const DirectionCandidates &candidates);

  void stepThroughMaze();

  // Walkable exits from the current cell in tie-break order, without the
  // reverse of the current direction unless it is the only way out
  DirectionCandidates availableDirections() const;

  PhantomMaze::Direction
  directionTowards(const DirectionCandidates &candidates,
                   const PhantomMaze::CellIndex &target) const;

  bool canMove(PhantomMaze::Direction direction) const;

  /**
   * @brief Moves straight at the point by at most one tick of speed.
   * @return true once the ghost stands on the point
   */
  bool moveTowards(const Vector2D &point);

  Ghost &m_ghost;
  const PhantomMaze::Maze &m_maze;
  PhantomMaze::CellIndex m_targetCell{};

private:
  GhostMovementMode m_movementMode;
  std::optional<PhantomMaze::CellIndex> m_lastDecisionCell;
};

#endif // GHOST_MOVER_HPP
