/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GHOST_MOVER_TABLE_HPP
#define GHOST_MOVER_TABLE_HPP

#include "entities/ghosts/GhostTypes.hpp"
#include <optional>

/**
 * @brief Which mover a ghost needs for its state and movement mode.
 *
 * @param state Vulnerability of the ghost
 * @param mode Current movement mode of the ghost
 * @param conductorMode Mode the scatter/chase timer asks for
 * @param activeMover Mode of the mover the ghost already has, if any
 * @return The mode of the mover to use. For Undecided, Scatter and Chase
 * this is the timer mode, unless a frightened ghost already runs its
 * frightened mover.
 * @throws std::logic_error when the timer mode is neither Scatter nor Chase
 */
GhostMovementMode selectMoverMode(GhostState state, GhostMovementMode mode,
                                  GhostMovementMode conductorMode,
                                  std::optional<GhostMovementMode> activeMover);

#endif // GHOST_MOVER_TABLE_HPP
