// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once
#include "gl.hpp"

namespace trispin {
namespace scene {

// A triangle with a different color at each corner. Positions and colors are
// stored in separate buffers.
class ColorTriangle {
public:
	ColorTriangle() : mArray{0}, mPositionBuffer{0}, mColorBuffer{0} {}
	ColorTriangle(const ColorTriangle &) = delete;
	ColorTriangle &operator=(const ColorTriangle &) = delete;

	// Set up render state and upload the triangle.
	void Init();
	void Render();
	// Point the attributes at the buffers and issue the draw call.
	void Draw();

private:
	GLuint mArray;
	GLuint mPositionBuffer;
	GLuint mColorBuffer;
};

} // namespace scene
} // namespace trispin
