/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GhostManagerTests
#include <boost/test/unit_test.hpp>

#include "ai/ghosts/GhostMover.hpp"
#include "gameplay/PlayerStats.hpp"
#include "managers/EventManager.hpp"
#include "managers/GhostManager.hpp"
#include "mocks/MockPlayer.hpp"
#include "world/GridMaze.hpp"

using namespace PhantomMaze;

namespace {
constexpr float DT = 1.0f / 60.0f;
}

struct GhostManagerFixture {
  GhostManagerFixture() : maze(GridMaze::classic()) {
    EventManager::Instance().clean();
    EventManager::Instance().init();
    // Clyde's corner; Clyde stays home in these tests
    player.setCell(CellIndex(1, 29));
  }
  ~GhostManagerFixture() { EventManager::Instance().clean(); }

  GridMaze maze;
  MockPlayer player;
  PlayerStats playerStats;
};

BOOST_FIXTURE_TEST_SUITE(GhostManagerTestSuite, GhostManagerFixture)

BOOST_AUTO_TEST_CASE(CreatesFourGhostsReadyToMove) {
  GhostManager manager(playerStats, maze, player);
  BOOST_CHECK_EQUAL(manager.getGhostCount(), 4u);

  for (GhostNickname nickname : ALL_GHOSTS) {
    const Ghost &ghost = manager.getGhost(nickname);
    BOOST_CHECK_EQUAL(ghost.getNickname(), nickname);
    BOOST_CHECK_EQUAL(ghost.getMovementMode(), GhostMovementMode::InHouse);
    BOOST_CHECK_EQUAL(ghost.getState(), GhostState::Normal);
    BOOST_CHECK(ghost.isMoving());
  }
}

BOOST_AUTO_TEST_CASE(BlinkyAndPinkyLeaveFirst) {
  GhostManager manager(playerStats, maze, player);
  for (int i = 0; i < 200; ++i) {
    manager.update(DT);
  }

  BOOST_CHECK_EQUAL(manager.getGhost(GhostNickname::Blinky).getMovementMode(),
                    GhostMovementMode::Scatter);
  BOOST_CHECK_NE(manager.getGhost(GhostNickname::Pinky).getMovementMode(),
                 GhostMovementMode::InHouse);
  BOOST_CHECK_EQUAL(manager.getGhost(GhostNickname::Inky).getMovementMode(),
                    GhostMovementMode::InHouse);
  BOOST_CHECK_EQUAL(manager.getGhost(GhostNickname::Clyde).getMovementMode(),
                    GhostMovementMode::InHouse);
  BOOST_CHECK_EQUAL(EventManager::Instance().getPendingDispatchCount(), 0u);
}

BOOST_AUTO_TEST_CASE(PowerPillFrightensEveryone) {
  GhostManager manager(playerStats, maze, player);
  manager.update(DT);

  manager.powerPillEaten();
  BOOST_CHECK(playerStats.isFrightSessionActive());
  for (GhostNickname nickname : ALL_GHOSTS) {
    BOOST_CHECK_EQUAL(manager.getGhost(nickname).getState(), GhostState::Frightened);
  }
}

BOOST_AUTO_TEST_CASE(ResetSendsEveryoneHome) {
  GhostManager manager(playerStats, maze, player);
  for (int i = 0; i < 60; ++i) {
    manager.update(DT);
  }
  manager.powerPillEaten();

  manager.reset();
  for (GhostNickname nickname : ALL_GHOSTS) {
    const Ghost &ghost = manager.getGhost(nickname);
    BOOST_CHECK_EQUAL(ghost.getMovementMode(), GhostMovementMode::InHouse);
    BOOST_CHECK_EQUAL(ghost.getState(), GhostState::Normal);
    BOOST_CHECK(ghost.getMover() == nullptr);
    BOOST_CHECK_CLOSE(ghost.getPosition().getX(),
                      Tile::toCenterCanvas(ghost.getSpawnCell()).getX(), 0.001f);
  }
}

BOOST_AUTO_TEST_CASE(StopAndClean) {
  GhostManager manager(playerStats, maze, player);
  manager.update(DT);

  manager.stopMoving();
  for (GhostNickname nickname : ALL_GHOSTS) {
    BOOST_CHECK(!manager.getGhost(nickname).isMoving());
  }

  manager.reset();
  manager.update(DT);
  manager.clean();
  for (GhostNickname nickname : ALL_GHOSTS) {
    BOOST_CHECK(manager.getGhost(nickname).getMover() == nullptr);
    BOOST_CHECK(!manager.getGhost(nickname).isMoving());
  }
}

BOOST_AUTO_TEST_SUITE_END()
