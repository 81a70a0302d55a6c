// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "scene_spin_cube.hpp"

#include "gl.hpp"
#include "gl_debug.hpp"
#include "gl_shader.hpp"
#include "mesh.hpp"
#include "spin.hpp"

#include <glm/gtc/type_ptr.hpp>

namespace trispin {
namespace scene {
namespace spin_cube {

namespace {

GLuint Array;
GLuint PositionBuffer;
GLuint ColorBuffer;
Spin Rotation;

} // namespace

void Init() {
	const mesh::CubeArrays arrays = mesh::ExpandCubeArrays();

	glGenBuffers(1, &PositionBuffer);
	glBindBuffer(GL_ARRAY_BUFFER, PositionBuffer);
	glBufferData(GL_ARRAY_BUFFER, sizeof(arrays.positions),
	             arrays.positions.data(), GL_STATIC_DRAW);

	glGenBuffers(1, &ColorBuffer);
	glBindBuffer(GL_ARRAY_BUFFER, ColorBuffer);
	glBufferData(GL_ARRAY_BUFFER, sizeof(arrays.colors), arrays.colors.data(),
	             GL_STATIC_DRAW);

	const GLuint position = static_cast<GLuint>(gl_shader::Cube.position);
	const GLuint color = static_cast<GLuint>(gl_shader::Cube.color);
	glGenVertexArrays(1, &Array);
	glBindVertexArray(Array);
	glEnableVertexAttribArray(position);
	glBindBuffer(GL_ARRAY_BUFFER, PositionBuffer);
	glVertexAttribPointer(position, 3, GL_FLOAT, GL_FALSE, 0,
	                      reinterpret_cast<void *>(0));
	glEnableVertexAttribArray(color);
	glBindBuffer(GL_ARRAY_BUFFER, ColorBuffer);
	glVertexAttribPointer(color, 3, GL_FLOAT, GL_FALSE, 0,
	                      reinterpret_cast<void *>(0));

	glUseProgram(gl_shader::Cube.program);
	glEnable(GL_DEPTH_TEST);

	Rotation = Spin{};
	Draw();
	gl_debug::CheckErrors("spin cube init");
}

void Update() {
	Rotation.Step();
}

void Render() {
	glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
	glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
	Draw();
}

void Draw() {
	glUseProgram(gl_shader::Cube.program);
	glUniformMatrix4fv(gl_shader::Cube.matrix, 1, GL_FALSE,
	                   glm::value_ptr(Rotation.matrix()));
	glBindVertexArray(Array);
	glDrawArrays(GL_TRIANGLES, 0, mesh::CubeArrayVertexCount);
}

const Spin &CurrentSpin() {
	return Rotation;
}

} // namespace spin_cube
} // namespace scene
} // namespace trispin
