// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "scene_cube.hpp"

#include "gl_debug.hpp"
#include "gl_shader.hpp"
#include "mesh.hpp"

#include <glm/gtc/type_ptr.hpp>

namespace trispin {
namespace scene {

void Cube::Init() {
	const GLuint position = static_cast<GLuint>(gl_shader::Cube.position);
	const GLuint color = static_cast<GLuint>(gl_shader::Cube.color);

	glGenVertexArrays(1, &mArray);
	glBindVertexArray(mArray);
	glGenBuffers(3, mBuffer);
	glBindBuffer(GL_ARRAY_BUFFER, mBuffer[0]);
	glBufferData(GL_ARRAY_BUFFER, sizeof(mesh::CubePositions),
	             mesh::CubePositions, GL_STATIC_DRAW);
	glEnableVertexAttribArray(position);
	glVertexAttribPointer(position, 3, GL_FLOAT, GL_FALSE, 0,
	                      reinterpret_cast<void *>(0));
	glBindBuffer(GL_ARRAY_BUFFER, mBuffer[1]);
	glBufferData(GL_ARRAY_BUFFER, sizeof(mesh::CubeColors), mesh::CubeColors,
	             GL_STATIC_DRAW);
	glEnableVertexAttribArray(color);
	glVertexAttribPointer(color, 3, GL_FLOAT, GL_FALSE, 0,
	                      reinterpret_cast<void *>(0));
	// The element buffer binding is part of the vertex array state.
	glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, mBuffer[2]);
	glBufferData(GL_ELEMENT_ARRAY_BUFFER, sizeof(mesh::CubeIndices),
	             mesh::CubeIndices, GL_STATIC_DRAW);
	glBindVertexArray(0);

	glEnable(GL_DEPTH_TEST);
	gl_debug::CheckErrors("cube init");
}

void Cube::Update() {
	mSpin.Step();
}

void Cube::Render() {
	glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
	glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
	Draw();
}

void Cube::Draw() {
	glUseProgram(gl_shader::Cube.program);
	glUniformMatrix4fv(gl_shader::Cube.matrix, 1, GL_FALSE,
	                   glm::value_ptr(mSpin.matrix()));
	glBindVertexArray(mArray);
	glDrawElements(GL_TRIANGLES, mesh::CubeIndexCount, GL_UNSIGNED_SHORT,
	               reinterpret_cast<void *>(0));
}

} // namespace scene
} // namespace trispin
