// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "spin.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace trispin {

Spin::Spin(float scale)
	: mMatrix{glm::scale(glm::mat4(1.0f), glm::vec3(scale))},
	  mAngles{0.0f}, mSteps{0} {}

void Spin::Step() {
	// Order matters: z, then x, then y, each applied on the right.
	mMatrix = glm::rotate(mMatrix, StepAngle, glm::vec3(0.0f, 0.0f, 1.0f));
	mMatrix = glm::rotate(mMatrix, StepAngle, glm::vec3(1.0f, 0.0f, 0.0f));
	mMatrix = glm::rotate(mMatrix, StepAngle, glm::vec3(0.0f, 1.0f, 0.0f));
	mAngles += glm::vec3(StepAngle);
	mSteps++;
}

} // namespace trispin
