// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "scene_color_triangle.hpp"

#include "gl_debug.hpp"
#include "gl_shader.hpp"
#include "mesh.hpp"

namespace trispin {
namespace scene {

void ColorTriangle::Init() {
	glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
	glEnable(GL_DEPTH_TEST);
	// Near things obscure far things.
	glDepthFunc(GL_LEQUAL);

	glGenVertexArrays(1, &mArray);
	glGenBuffers(1, &mPositionBuffer);
	glGenBuffers(1, &mColorBuffer);
	glBindBuffer(GL_ARRAY_BUFFER, mPositionBuffer);
	glBufferData(GL_ARRAY_BUFFER, sizeof(mesh::TrianglePositions),
	             mesh::TrianglePositions, GL_STATIC_DRAW);
	glBindBuffer(GL_ARRAY_BUFFER, mColorBuffer);
	glBufferData(GL_ARRAY_BUFFER, sizeof(mesh::TriangleColors),
	             mesh::TriangleColors, GL_STATIC_DRAW);
	glBindBuffer(GL_ARRAY_BUFFER, 0);
	gl_debug::CheckErrors("color triangle init");
}

void ColorTriangle::Render() {
	glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
	Draw();
}

void ColorTriangle::Draw() {
	const GLuint position = static_cast<GLuint>(gl_shader::Color.position);
	const GLuint color = static_cast<GLuint>(gl_shader::Color.color);

	glUseProgram(gl_shader::Color.program);
	glBindVertexArray(mArray);
	glBindBuffer(GL_ARRAY_BUFFER, mPositionBuffer);
	glVertexAttribPointer(position, 2, GL_FLOAT, GL_FALSE, 0,
	                      reinterpret_cast<void *>(0));
	glBindBuffer(GL_ARRAY_BUFFER, mColorBuffer);
	glVertexAttribPointer(color, 3, GL_FLOAT, GL_FALSE, 0,
	                      reinterpret_cast<void *>(0));
	glEnableVertexAttribArray(position);
	glEnableVertexAttribArray(color);
	glDrawArrays(GL_TRIANGLES, 0, mesh::TriangleVertexCount);
}

} // namespace scene
} // namespace trispin
