/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Entity.hpp"

void Entity::updateAnimation(float deltaTime) {
  if (m_numFrames <= 1 || m_animSpeed <= 0) {
    return;
  }

  m_animationAccumulator += deltaTime;
  const float frameTime = m_animSpeed / 1000.0f;  // ms to seconds

  if (m_animationAccumulator >= frameTime) {
    m_currentFrame = (m_currentFrame + 1) % m_numFrames;
    m_animationAccumulator -= frameTime;  // Preserve excess time for smooth timing
  }
}
