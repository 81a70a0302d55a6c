// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <array>
#include <string_view>

namespace trispin {
namespace gl_shader {

// Vertex shaders come first, followed by fragment shaders.
constexpr int ShaderCount = 5;
constexpr int VertexShaderCount = 3;
constexpr int ProgramCount = 3;

// Indexes into the program array.
enum ProgramId {
	FlatProgramId,
	ColorProgramId,
	CubeProgramId,
};

// The source code for a shader.
struct ShaderSource {
	const char *ptr;
	int size;
};

// Get the source code for shaders embedded in the program.
std::array<ShaderSource, ShaderCount> GetEmbeddedShaderSource();

// Shader filenames, relative to the shader directory, in the same order as the
// embedded shader source.
extern const std::array<std::string_view, ShaderCount> ShaderFilenames;

// Specification for a shader program.
struct ProgramSpec {
	std::string_view name;
	int vertex;   // Index into shader array.
	int fragment; // Index into shader array.
};

// Specifications for all programs, indexed by ProgramId.
extern const std::array<ProgramSpec, ProgramCount> ProgramSpecs;

} // namespace gl_shader
} // namespace trispin
