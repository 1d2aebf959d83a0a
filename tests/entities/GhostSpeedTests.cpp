/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GhostSpeedTests
#include <boost/test/unit_test.hpp>

#include "ai/ghosts/GhostChaseMover.hpp"
#include "ai/ghosts/GhostMover.hpp"
#include "entities/ghosts/Blinky.hpp"
#include "entities/ghosts/Pinky.hpp"
#include "gameplay/PlayerStats.hpp"
#include "managers/EventManager.hpp"
#include "mocks/MockPlayer.hpp"
#include "mocks/TestGhost.hpp"
#include "world/GridMaze.hpp"

using namespace PhantomMaze;

namespace {
constexpr float DT = 1.0f / 60.0f;
constexpr float TOLERANCE = 0.001f;
} // namespace

struct GhostSpeedFixture {
  GhostSpeedFixture() : maze(GridMaze::classic()) {
    EventManager::Instance().clean();
    EventManager::Instance().init();
  }
  ~GhostSpeedFixture() { EventManager::Instance().clean(); }

  void eatDots(int count) {
    for (int i = 0; i < count; ++i) {
      playerStats.dotEaten();
    }
  }

  GridMaze maze;
  MockPlayer player;
  PlayerStats playerStats;
};

BOOST_FIXTURE_TEST_SUITE(GhostSpeedTestSuite, GhostSpeedFixture)

BOOST_AUTO_TEST_CASE(SpeedByModeAndState) {
  TestGhost ghost(GhostNickname::Pinky, playerStats, maze, player,
                  Vector2D(13.5f, 11.0f), Direction::Left);
  ghost.reset();
  BOOST_CHECK_CLOSE(ghost.getSpeed(), Ghost::IN_HOUSE_SPEED, TOLERANCE);

  ghost.setMovementMode(GhostMovementMode::Scatter);
  BOOST_CHECK_CLOSE(ghost.getSpeed(), 0.9375f, TOLERANCE);

  playerStats.powerPillEaten();
  ghost.powerPillEaten();
  BOOST_CHECK_CLOSE(ghost.getSpeed(), 0.625f, TOLERANCE);
}

BOOST_AUTO_TEST_CASE(InHouseSpeedWinsOverFright) {
  TestGhost ghost(GhostNickname::Inky, playerStats, maze, player,
                  Vector2D(11.5f, 14.0f), Direction::Up);
  ghost.reset();
  playerStats.powerPillEaten();
  ghost.powerPillEaten();
  BOOST_CHECK_EQUAL(ghost.getState(), GhostState::Frightened);
  BOOST_CHECK_CLOSE(ghost.getSpeed(), Ghost::IN_HOUSE_SPEED, TOLERANCE);
}

BOOST_AUTO_TEST_CASE(TunnelSlowsNormalGhostsOnly) {
  TestGhost ghost(GhostNickname::Clyde, playerStats, maze, player,
                  Vector2D(2.0f, 14.0f), Direction::Left);
  ghost.reset();
  ghost.setMovementMode(GhostMovementMode::Chase);
  BOOST_REQUIRE(maze.isTunnelCell(ghost.getTile().getIndex()));
  BOOST_CHECK_CLOSE(ghost.getSpeed(), 0.5f, TOLERANCE);

  playerStats.powerPillEaten();
  ghost.powerPillEaten();
  BOOST_CHECK_CLOSE(ghost.getSpeed(), 0.625f, TOLERANCE);
}

BOOST_AUTO_TEST_CASE(EyesAreFastest) {
  TestGhost ghost(GhostNickname::Blinky, playerStats, maze, player,
                  Vector2D(13.5f, 11.0f), Direction::Left);
  ghost.reset();
  ghost.update(DT);
  ghost.update(DT);
  playerStats.powerPillEaten();
  ghost.powerPillEaten();

  player.setCell(ghost.getTile().getIndex());
  ghost.update(DT);
  BOOST_REQUIRE_EQUAL(ghost.getState(), GhostState::Eyes);
  BOOST_CHECK_CLOSE(ghost.getSpeed(), Ghost::EYES_SPEED, TOLERANCE);
}

BOOST_AUTO_TEST_CASE(FrightenedGhostLeavesHouseAtFrightSpeed) {
  TestGhost ghost(GhostNickname::Blinky, playerStats, maze, player,
                  Vector2D(13.5f, 11.0f), Direction::Left);
  ghost.reset();
  ghost.update(DT);
  BOOST_REQUIRE_EQUAL(ghost.getMovementMode(), GhostMovementMode::Undecided);

  playerStats.powerPillEaten();
  ghost.powerPillEaten();
  ghost.update(DT);

  // No frightened mover yet: the timer's mover runs, slowed down
  BOOST_CHECK_EQUAL(ghost.getState(), GhostState::Frightened);
  BOOST_CHECK_EQUAL(ghost.getMover()->getName(), "Scatter");
  BOOST_CHECK_CLOSE(ghost.getSpeed(), 0.625f, TOLERANCE);
  BOOST_CHECK_CLOSE(ghost.getPosition().getX(), 112.0f - 0.625f, TOLERANCE);
}

BOOST_AUTO_TEST_CASE(BlinkySpeedsUpAsDotsRunOut) {
  Blinky blinky(playerStats, maze, player);
  blinky.reset();
  blinky.setMovementMode(GhostMovementMode::Scatter);
  BOOST_CHECK_CLOSE(blinky.getSpeed(), 0.9375f, TOLERANCE);

  eatDots(LevelStats::TOTAL_DOTS - 21);
  BOOST_CHECK_CLOSE(blinky.getSpeed(), 0.9375f, TOLERANCE);

  // 20 dots left
  eatDots(1);
  BOOST_CHECK_CLOSE(blinky.getSpeed(), 1.0f, TOLERANCE);

  // 10 dots left
  eatDots(10);
  BOOST_CHECK_CLOSE(blinky.getSpeed(), 1.0625f, TOLERANCE);
}

BOOST_AUTO_TEST_CASE(ElroyDoesNotBeatTunnelOrFright) {
  Blinky blinky(playerStats, maze, player);
  blinky.reset();
  blinky.setMovementMode(GhostMovementMode::Chase);
  eatDots(LevelStats::TOTAL_DOTS - 5);

  blinky.setPosition(Tile::toCenterCanvas(Vector2D(25.0f, 14.0f)));
  BOOST_REQUIRE(maze.isTunnelCell(blinky.getTile().getIndex()));
  BOOST_CHECK_CLOSE(blinky.getSpeed(), 0.5f, TOLERANCE);

  playerStats.powerPillEaten();
  blinky.powerPillEaten();
  BOOST_CHECK_CLOSE(blinky.getSpeed(), 0.625f, TOLERANCE);
}

BOOST_AUTO_TEST_CASE(OtherGhostsNeverTurnElroy) {
  Pinky pinky(playerStats, maze, player);
  pinky.reset();
  pinky.setMovementMode(GhostMovementMode::Scatter);
  eatDots(LevelStats::TOTAL_DOTS - 5);
  BOOST_CHECK_CLOSE(pinky.getSpeed(), 0.9375f, TOLERANCE);
}

BOOST_AUTO_TEST_CASE(SpeedsFollowLevel) {
  PlayerStats levelFive(5);
  TestGhost ghost(GhostNickname::Pinky, levelFive, maze, player,
                  Vector2D(13.5f, 11.0f), Direction::Left);
  ghost.reset();
  ghost.setMovementMode(GhostMovementMode::Scatter);
  BOOST_CHECK_CLOSE(ghost.getSpeed(), 1.1875f, TOLERANCE);

  levelFive.powerPillEaten();
  ghost.powerPillEaten();
  BOOST_CHECK_CLOSE(ghost.getSpeed(), 0.75f, TOLERANCE);
}

BOOST_AUTO_TEST_CASE(CorridorRunCoversFullSpeedEveryTick) {
  // Top right corridor, heading for the far end of the maze
  TestGhost ghost(GhostNickname::Blinky, playerStats, maze, player,
                  Vector2D(26.0f, 1.0f), Direction::Left);
  ghost.reset();
  ghost.setMovementMode(GhostMovementMode::Chase);
  ghost.chaseTarget = CellIndex(1, 1);
  GhostChaseMover mover(ghost, maze);

  const float startX = ghost.getPosition().getX();
  const float speed = ghost.getSpeed();
  BOOST_REQUIRE_CLOSE(speed, 0.9375f, TOLERANCE);

  for (int tick = 1; tick <= 80; ++tick) {
    mover.update(DT);
    BOOST_REQUIRE_EQUAL(ghost.getDirection().current, Direction::Left);
    // Whatever a center stop held back is owed to the next step
    const float covered =
        startX - ghost.getPosition().getX() + ghost.getCarriedDistance();
    BOOST_REQUIRE_CLOSE(covered, tick * speed, TOLERANCE);

    if (tick == 77) {
      // Stopped on the center of (17, 1) with the rest of the step owed
      BOOST_CHECK_CLOSE(ghost.getPosition().getX(), 140.0f, TOLERANCE);
      BOOST_CHECK_CLOSE(ghost.getCarriedDistance(), 0.1875f, TOLERANCE);
    }
  }

  BOOST_CHECK_CLOSE(startX - ghost.getPosition().getX(), 80 * speed, TOLERANCE);
  BOOST_CHECK_EQUAL(ghost.getTile().getIndex(), CellIndex(17, 1));
}

BOOST_AUTO_TEST_SUITE_END()
