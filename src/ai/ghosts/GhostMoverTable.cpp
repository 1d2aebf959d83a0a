/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/ghosts/GhostMoverTable.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>

GhostMovementMode selectMoverMode(GhostState state, GhostMovementMode mode,
                                  GhostMovementMode conductorMode,
                                  std::optional<GhostMovementMode> activeMover) {
  switch (mode) {
  case GhostMovementMode::Undecided:
  case GhostMovementMode::Scatter:
  case GhostMovementMode::Chase: {
    if (state == GhostState::Frightened &&
        activeMover == GhostMovementMode::Frightened) {
      return GhostMovementMode::Frightened;
    }
    if (conductorMode != GhostMovementMode::Scatter &&
        conductorMode != GhostMovementMode::Chase) {
      const std::string message =
          std::format("Scatter/chase timer returned {}",
                      movementModeToString(conductorMode));
      MOVER_CRITICAL(message);
      throw std::logic_error(message);
    }
    return conductorMode;
  }
  case GhostMovementMode::InHouse:
    return GhostMovementMode::InHouse;
  case GhostMovementMode::GoingToHouse:
    return GhostMovementMode::GoingToHouse;
  case GhostMovementMode::Frightened:
    return GhostMovementMode::Frightened;
  }

  const std::string message = std::format(
      "No mover for state {} and mode {}", ghostStateToString(state),
      movementModeToString(mode));
  MOVER_CRITICAL(message);
  throw std::logic_error(message);
}
