/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "utils/Vector2D.hpp"
#include <SDL3/SDL.h>

/**
 * @brief Pure virtual base class for the animated actors in the maze.
 *
 * Holds the sprite position used for rendering and the looping animation
 * frame. Subclasses set m_numFrames and m_animSpeed; a single frame never
 * animates.
 */
class Entity {
 public:
  Entity() = default;
  virtual ~Entity() = default;

  /**
   * @brief Advance the entity by one simulation tick.
   *
   * @param deltaTime The time elapsed since the last tick, in seconds.
   */
  virtual void update(float deltaTime) = 0;

  /**
   * @brief Render the entity with interpolation support.
   *
   * @param renderer SDL renderer to draw into
   * @param cameraX Camera X offset
   * @param cameraY Camera Y offset
   * @param interpolationAlpha Blend factor between previous and current position (0.0-1.0)
   */
  virtual void render(SDL_Renderer* renderer, float cameraX, float cameraY, float interpolationAlpha = 1.0f) = 0;

  /**
   * @brief Release resources before destruction.
   */
  virtual void clean() = 0;

  Vector2D getPosition() const { return m_position; }

  Vector2D getInterpolatedPosition(float alpha) const {
    return Vector2D(
      m_previousPosition.getX() + (m_position.getX() - m_previousPosition.getX()) * alpha,
      m_previousPosition.getY() + (m_position.getY() - m_previousPosition.getY()) * alpha);
  }

  void storePositionForInterpolation() { m_previousPosition = m_position; }

  /**
   * @brief Set entity position directly (teleport).
   *
   * Resets the previous position too so that rendering does not slide.
   */
  virtual void setPosition(const Vector2D& position) {
    m_position = position;
    m_previousPosition = position;
  }

  /**
   * @brief Update position from movement (preserves interpolation state).
   */
  virtual void updatePositionFromMovement(const Vector2D& position) { m_position = position; }

  int getCurrentFrame() const { return m_currentFrame; }

 protected:
  /**
   * @brief Advance the looping animation frame using a deltaTime accumulator.
   */
  void updateAnimation(float deltaTime);

  Vector2D m_position{0, 0};
  Vector2D m_previousPosition{0, 0};  // For render interpolation
  int m_currentFrame{0};
  int m_numFrames{1};
  int m_animSpeed{100};  // Milliseconds per frame
  float m_animationAccumulator{0.0f};
};

#endif  // ENTITY_HPP
