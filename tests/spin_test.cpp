// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "spin.hpp"

#include <glm/geometric.hpp>
#include <glm/mat4x4.hpp>
#include <glm/matrix.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>

namespace trispin {
namespace {

constexpr float Tolerance = 1e-5f;

// Rotation matrixes, written out by hand. glm is column-major: m[col][row].
glm::mat4 RotateZ(float a) {
	glm::mat4 m{1.0f};
	m[0][0] = std::cos(a);
	m[0][1] = std::sin(a);
	m[1][0] = -std::sin(a);
	m[1][1] = std::cos(a);
	return m;
}

glm::mat4 RotateX(float a) {
	glm::mat4 m{1.0f};
	m[1][1] = std::cos(a);
	m[1][2] = std::sin(a);
	m[2][1] = -std::sin(a);
	m[2][2] = std::cos(a);
	return m;
}

glm::mat4 RotateY(float a) {
	glm::mat4 m{1.0f};
	m[0][0] = std::cos(a);
	m[0][2] = -std::sin(a);
	m[2][0] = std::sin(a);
	m[2][2] = std::cos(a);
	return m;
}

glm::mat4 Scale(float s) {
	glm::mat4 m{1.0f};
	m[0][0] = s;
	m[1][1] = s;
	m[2][2] = s;
	return m;
}

void ExpectMatrixNear(const glm::mat4 &actual, const glm::mat4 &expected) {
	for (int col = 0; col < 4; col++) {
		for (int row = 0; row < 4; row++) {
			EXPECT_NEAR(actual[col][row], expected[col][row], Tolerance)
				<< "col " << col << " row " << row;
		}
	}
}

TEST(SpinTest, StartsScaledWithoutRotation) {
	Spin spin;
	ExpectMatrixNear(spin.matrix(), Scale(0.5f));
	EXPECT_EQ(spin.steps(), 0);
	EXPECT_FLOAT_EQ(spin.angles().x, 0.0f);
	EXPECT_FLOAT_EQ(spin.angles().y, 0.0f);
	EXPECT_FLOAT_EQ(spin.angles().z, 0.0f);
}

TEST(SpinTest, StepAdvancesEachAxisByFixedIncrement) {
	Spin spin;
	spin.Step();
	const float a = std::numbers::pi_v<float> / 100.0f;
	EXPECT_FLOAT_EQ(Spin::StepAngle, a);
	EXPECT_EQ(spin.steps(), 1);
	EXPECT_FLOAT_EQ(spin.angles().x, a);
	EXPECT_FLOAT_EQ(spin.angles().y, a);
	EXPECT_FLOAT_EQ(spin.angles().z, a);
}

TEST(SpinTest, StepRotatesAroundZThenXThenY) {
	Spin spin;
	spin.Step();
	const float a = Spin::StepAngle;
	ExpectMatrixNear(spin.matrix(),
	                 Scale(0.5f) * RotateZ(a) * RotateX(a) * RotateY(a));
}

TEST(SpinTest, StepsAccumulate) {
	Spin spin{1.0f};
	glm::mat4 expected{1.0f};
	const float a = Spin::StepAngle;
	for (int i = 0; i < 10; i++) {
		spin.Step();
		expected = expected * RotateZ(a) * RotateX(a) * RotateY(a);
	}
	EXPECT_EQ(spin.steps(), 10);
	EXPECT_NEAR(spin.angles().y, 10.0f * a, Tolerance);
	ExpectMatrixNear(spin.matrix(), expected);
}

TEST(SpinTest, RotationPreservesScale) {
	Spin spin;
	for (int i = 0; i < 150; i++) {
		spin.Step();
	}
	const glm::mat4 &m = spin.matrix();
	for (int col = 0; col < 3; col++) {
		EXPECT_NEAR(glm::length(glm::vec3(m[col])), 0.5f, 1e-4f);
	}
	EXPECT_NEAR(glm::determinant(m), 0.125f, 1e-4f);
}

} // namespace
} // namespace trispin
