// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "scene_triangle.hpp"

#include "gl_debug.hpp"
#include "gl_shader.hpp"
#include "mesh.hpp"

namespace trispin {
namespace scene {

void Triangle::Init() {
	glGenVertexArrays(1, &mArray);
	glBindVertexArray(mArray);
	glGenBuffers(1, &mBuffer);
	glBindBuffer(GL_ARRAY_BUFFER, mBuffer);
	glBufferData(GL_ARRAY_BUFFER, sizeof(mesh::TrianglePositions),
	             mesh::TrianglePositions, GL_STATIC_DRAW);
	const GLuint position = static_cast<GLuint>(gl_shader::Flat.position);
	glEnableVertexAttribArray(position);
	glVertexAttribPointer(position, 2, GL_FLOAT, GL_FALSE, 0,
	                      reinterpret_cast<void *>(0));
	glBindVertexArray(0);
	gl_debug::CheckErrors("triangle init");
}

void Triangle::Render() {
	glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
	glClear(GL_COLOR_BUFFER_BIT);
	Draw();
}

void Triangle::Draw() {
	glUseProgram(gl_shader::Flat.program);
	glUniform4fv(gl_shader::Flat.color, 1, mesh::FlatTriangleColor);
	glBindVertexArray(mArray);
	glDrawArrays(GL_TRIANGLES, 0, mesh::TriangleVertexCount);
}

} // namespace scene
} // namespace trispin
