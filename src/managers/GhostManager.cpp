/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/GhostManager.hpp"
#include "core/Logger.hpp"
#include "entities/ghosts/Blinky.hpp"
#include "entities/ghosts/Clyde.hpp"
#include "entities/ghosts/Inky.hpp"
#include "entities/ghosts/Pinky.hpp"
#include "gameplay/PlayerStats.hpp"
#include <format>

GhostManager::GhostManager(PlayerStats &playerStats,
                           const PhantomMaze::Maze &maze,
                           const PlayerActor &player)
    : m_playerStats(playerStats) {
  auto blinky = std::make_unique<Blinky>(playerStats, maze, player);
  const Ghost &blinkyRef = *blinky;

  m_ghosts[static_cast<size_t>(GhostNickname::Blinky)] = std::move(blinky);
  m_ghosts[static_cast<size_t>(GhostNickname::Pinky)] =
      std::make_unique<Pinky>(playerStats, maze, player);
  m_ghosts[static_cast<size_t>(GhostNickname::Inky)] =
      std::make_unique<Inky>(playerStats, maze, player, blinkyRef);
  m_ghosts[static_cast<size_t>(GhostNickname::Clyde)] =
      std::make_unique<Clyde>(playerStats, maze, player);

  reset();
  GHOSTMGR_INFO(std::format("Created {} ghosts", m_ghosts.size()));
}

GhostManager::~GhostManager() = default;

void GhostManager::update(float deltaTime) {
  for (GhostNickname nickname : ALL_GHOSTS) {
    getGhost(nickname).update(deltaTime);
  }
}

void GhostManager::render(SDL_Renderer *renderer, float cameraX, float cameraY,
                          float interpolationAlpha) {
  for (auto &ghost : m_ghosts) {
    ghost->render(renderer, cameraX, cameraY, interpolationAlpha);
  }
}

void GhostManager::powerPillEaten() {
  m_playerStats.powerPillEaten();
  for (auto &ghost : m_ghosts) {
    ghost->powerPillEaten();
  }
  GHOSTMGR_DEBUG("Power pill eaten, ghosts frightened");
}

void GhostManager::reset() {
  for (auto &ghost : m_ghosts) {
    ghost->reset();
  }
}

void GhostManager::stopMoving() {
  for (auto &ghost : m_ghosts) {
    ghost->stopMoving();
  }
}

void GhostManager::clean() {
  for (auto &ghost : m_ghosts) {
    ghost->clean();
  }
  GHOSTMGR_INFO("GhostManager cleaned");
}

Ghost &GhostManager::getGhost(GhostNickname nickname) {
  return *m_ghosts[static_cast<size_t>(nickname)];
}

const Ghost &GhostManager::getGhost(GhostNickname nickname) const {
  return *m_ghosts[static_cast<size_t>(nickname)];
}
