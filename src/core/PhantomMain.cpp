/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "entities/PlayerActor.hpp"
#include "entities/ghosts/Ghost.hpp"
#include "events/GhostEvents.hpp"
#include "gameplay/PlayerStats.hpp"
#include "managers/EventManager.hpp"
#include "managers/GhostManager.hpp"
#include "managers/SettingsManager.hpp"
#include "world/GridMaze.hpp"
#include <boost/container/small_vector.hpp>
#include <exception>
#include <format>
#include <random>
#include <string>

using namespace PhantomMaze;

namespace {

const std::string GAME_NAME{"PhantomMaze"};
constexpr float FIXED_TIMESTEP = 1.0f / 60.0f;
constexpr int DEFAULT_FRAMES = 60 * 120;

/**
 * @brief Stand-in for a human player: wanders the maze, taking a random
 * exit at every junction, and eats whatever lies in its cell.
 */
class ScriptedPlayer : public PlayerActor {
public:
  static constexpr float START_CELL_X = 13.5f;
  static constexpr float START_CELL_Y = 23.0f;

  ScriptedPlayer(const GridMaze &maze, const PlayerStats &playerStats)
      : m_maze(maze), m_playerStats(playerStats), m_tile(maze.getWidthInCells()) {
    reset();
  }

  const Tile &getTile() const override { return m_tile; }
  Direction getFacing() const override { return m_facing; }

  void reset() {
    m_tile.updateWithPosition(Tile::toCenterCanvas(Vector2D(START_CELL_X, START_CELL_Y)));
    m_facing = Direction::Left;
    m_carriedDistance = 0.0f;
  }

  void update() {
    if (m_tile.isInCenter()) {
      chooseDirection();
      if (!canMove(m_facing)) {
        return;
      }
    }

    const LevelProps &props = m_playerStats.getLevelStats().getLevelProps();
    const float percent = m_playerStats.isFrightSessionActive() ? props.frightPacManSpeedPc
                                                                 : props.pacManSpeedPc;
    const float distance = Ghost::BASE_SPEED * percent / 100.0f + m_carriedDistance;
    m_carriedDistance = 0.0f;

    // Stop on the cell center so every junction is seen, owing the rest of
    // the step to the next frame
    const Vector2D position = m_tile.getPosition();
    const Vector2D center = m_tile.getCenter();
    const Vector2D step = directionToVector(m_facing);
    const float ahead = isVertical(m_facing) ? (center.getY() - position.getY()) * step.getY()
                                             : (center.getX() - position.getX()) * step.getX();
    if (ahead > 0.0f && ahead <= distance) {
      m_tile.updateWithPosition(center);
      m_carriedDistance = distance - ahead;
      return;
    }
    m_tile.updateWithPosition(position + step * distance);
  }

private:
  bool canMove(Direction direction) const {
    return m_maze.isWalkable(m_tile.nextTileWrapped(direction).getIndex());
  }

  void chooseDirection() {
    const CellIndex cell = m_tile.getIndex();
    if (m_lastDecisionCell == cell && canMove(m_facing)) {
      return;
    }
    m_lastDecisionCell = cell;

    boost::container::small_vector<Direction, 4> options;
    for (Direction direction : DIRECTION_PRIORITY) {
      if (canMove(direction) && direction != reverseDirection(m_facing)) {
        options.push_back(direction);
      }
    }
    if (options.empty()) {
      m_facing = reverseDirection(m_facing);
      return;
    }

    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, options.size() - 1);
    m_facing = options[pick(rng)];
    m_tile.updateWithPosition(m_tile.getCenter());
  }

  const GridMaze &m_maze;
  const PlayerStats &m_playerStats;
  Tile m_tile;
  Direction m_facing{Direction::Left};
  CellIndex m_lastDecisionCell{-1, -1};
  float m_carriedDistance{0.0f};
};

} // namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  SIM_INFO(std::format("Initializing {}", GAME_NAME));

  auto& settingsManager = SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/settings.json")) {
    SIM_WARN("Failed to load settings.json - using defaults");
  } else {
    SIM_INFO("Settings loaded from res/settings.json");
  }

  LevelPropsTable levelTable = LevelPropsTable::arcade();
  if (!levelTable.loadFromFile("res/data/levels.json")) {
    SIM_WARN("Failed to load levels.json - using arcade level table");
    levelTable = LevelPropsTable::arcade();
  }

  const int startLevel = settingsManager.get<int>("simulation", "level", 1);
  const int frames = settingsManager.get<int>("simulation", "frames", DEFAULT_FRAMES);

  EventManager& eventManager = EventManager::Instance();
  if (!eventManager.init()) {
    SIM_CRITICAL("Failed to initialize EventManager");
    return -1;
  }

  try {
    GridMaze maze = GridMaze::classic();
    PlayerStats playerStats(startLevel, levelTable);
    ScriptedPlayer player(maze, playerStats);
    GhostManager ghostManager(playerStats, maze, player);

    // Several ghosts can catch the player in the same frame
    bool lifeLost = false;

    eventManager.registerHandler(EventTypeId::PlayerEaten, [&](const EventData& data) {
      if (lifeLost) {
        return;
      }
      lifeLost = true;
      [[maybe_unused]] const auto* event = static_cast<const PlayerEatenEvent*>(data.event.get());
      playerStats.newLife();
      ghostManager.reset();
      player.reset();
      SIM_INFO(std::format("Caught by {}, {} lives left",
                           ghostNicknameToString(event->getEatenBy()), playerStats.getLives()));
    });

    eventManager.registerHandler(EventTypeId::GhostEaten, [&](const EventData& data) {
      [[maybe_unused]] const auto* event = static_cast<const GhostEatenEvent*>(data.event.get());
      const int points = playerStats.ghostEaten();
      SIM_INFO(std::format("Ate {} for {} points",
                           ghostNicknameToString(event->getGhost().getNickname()), points));
    });

    eventManager.registerHandler(EventTypeId::GhostInsideHouse, []([[maybe_unused]] const EventData& data) {
      [[maybe_unused]] const auto* event = static_cast<const GhostInsideHouseEvent*>(data.event.get());
      SIM_DEBUG(std::format("{} is back in the house",
                            ghostNicknameToString(event->getGhost().getNickname())));
    });

    int frame = 0;
    for (; frame < frames && playerStats.getLives() > 0; ++frame) {
      lifeLost = false;

      playerStats.update(FIXED_TIMESTEP);
      player.update();

      switch (maze.consume(player.getTile().getIndex())) {
      case MazeCell::Dot:
        playerStats.dotEaten();
        break;
      case MazeCell::PowerPill:
        ghostManager.powerPillEaten();
        break;
      default:
        break;
      }

      if (playerStats.getLevelStats().isCleared()) {
        playerStats.newLevel();
        maze = GridMaze::classic();
        ghostManager.reset();
        player.reset();
      }

      ghostManager.update(FIXED_TIMESTEP);
      eventManager.update();
    }

    SIM_INFO(std::format("Simulation ended after {} frames: level {}, score {}, lives {}", frame,
                         playerStats.getLevelStats().getLevelNumber(), playerStats.getScore(),
                         playerStats.getLives()));

    ghostManager.clean();
  } catch (const std::exception& e) {
    SIM_CRITICAL(std::format("Simulation stopped: {}", e.what()));
    eventManager.clean();
    return -1;
  }

  eventManager.clean();
  return 0;
}
