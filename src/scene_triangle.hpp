// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once
#include "gl.hpp"

namespace trispin {
namespace scene {

// A triangle drawn in a single solid color.
class Triangle {
public:
	Triangle() : mArray{0}, mBuffer{0} {}
	Triangle(const Triangle &) = delete;
	Triangle &operator=(const Triangle &) = delete;

	void Init();
	void Render();
	// Issue the draw call. Render() clears first.
	void Draw();

private:
	GLuint mArray;
	GLuint mBuffer;
};

} // namespace scene
} // namespace trispin
