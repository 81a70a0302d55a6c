// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <numbers>

namespace trispin {

// A model matrix which is rotated a fixed amount around the z, x, and y axes
// every frame.
class Spin {
public:
	// Rotation applied around each axis per step, in radians.
	static constexpr float StepAngle = std::numbers::pi_v<float> / 100.0f;

	// Scale applied to the cube by the demos.
	static constexpr float DefaultScale = 0.5f;

	explicit Spin(float scale = DefaultScale);

	// Advance the rotation by one frame.
	void Step();

	const glm::mat4 &matrix() const { return mMatrix; }
	// Total rotation applied around x, y, and z.
	const glm::vec3 &angles() const { return mAngles; }
	long steps() const { return mSteps; }

private:
	glm::mat4 mMatrix;
	glm::vec3 mAngles;
	long mSteps;
};

} // namespace trispin
