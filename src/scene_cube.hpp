// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once
#include "gl.hpp"
#include "spin.hpp"

namespace trispin {
namespace scene {

// A spinning cube, drawn from an index buffer.
class Cube {
public:
	Cube() : mArray{0}, mBuffer{0, 0, 0} {}
	Cube(const Cube &) = delete;
	Cube &operator=(const Cube &) = delete;

	void Init();
	// Advance the rotation by one frame.
	void Update();
	void Render();
	// Upload the current matrix and issue the draw call.
	void Draw();

	const Spin &spin() const { return mSpin; }

private:
	GLuint mArray;
	GLuint mBuffer[3]; // Position, color, index.
	Spin mSpin;
};

} // namespace scene
} // namespace trispin
