// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "gl.hpp"

#include <string_view>

namespace trispin {
namespace gl_shader {

// Program which draws 2D vertexes in a single color.
struct FlatProgram {
	GLuint program;
	GLint position; // Attribute, vec2.
	GLint color;    // Uniform, vec4.
};

// Program which draws 2D vertexes with per-vertex color.
struct ColorProgram {
	GLuint program;
	GLint position; // Attribute, vec2.
	GLint color;    // Attribute, vec3.
};

// Program which draws transformed 3D vertexes with per-vertex color.
struct CubeProgram {
	GLuint program;
	GLint position; // Attribute, vec3.
	GLint color;    // Attribute, vec3.
	GLint matrix;   // Uniform, mat4.
};

extern FlatProgram Flat;
extern ColorProgram Color;
extern CubeProgram Cube;

// Compile a shader from source. On failure, logs the compiler output and exits.
GLuint CompileShader(GLenum shaderType, std::string_view name,
                     std::string_view source);

// Link a shader program. On failure, logs the linker output and exits. The
// shaders are detached afterwards and may be deleted.
GLuint LinkProgram(std::string_view name, GLuint vertex, GLuint fragment);

// Compile all OpenGL shader programs and look up their attributes and
// uniforms.
void Init();

} // namespace gl_shader
} // namespace trispin
