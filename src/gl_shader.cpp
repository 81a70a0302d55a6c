// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "gl_shader.hpp"

#include "gl_shader_data.hpp"
#include "log.hpp"
#include "os_file.hpp"
#include "var.hpp"

#include <array>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace trispin {
namespace gl_shader {

namespace {

// Trim trailing whitespace and NUL from a driver info log.
void TrimLog(std::string *text) {
	while (!text->empty()) {
		const char c = text->back();
		if (c != '\0' && c != '\n' && c != '\r' && c != ' ') {
			break;
		}
		text->pop_back();
	}
}

std::string GetShaderLog(GLuint shader) {
	GLint length = 0;
	glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
	std::string text;
	if (length > 0) {
		text.resize(static_cast<std::size_t>(length));
		GLsizei written = 0;
		glGetShaderInfoLog(shader, length, &written, text.data());
		text.resize(static_cast<std::size_t>(written));
	}
	TrimLog(&text);
	return text;
}

std::string GetProgramLog(GLuint program) {
	GLint length = 0;
	glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
	std::string text;
	if (length > 0) {
		text.resize(static_cast<std::size_t>(length));
		GLsizei written = 0;
		glGetProgramInfoLog(program, length, &written, text.data());
		text.resize(static_cast<std::size_t>(written));
	}
	TrimLog(&text);
	return text;
}

// Get the source code for all shaders, either from the executable or from the
// project directory.
std::array<std::string, ShaderCount> LoadSources() {
	std::array<std::string, ShaderCount> sources;
	if (var::ProjectPath.get().empty()) {
		std::array<ShaderSource, ShaderCount> embedded =
			GetEmbeddedShaderSource();
		for (int i = 0; i < ShaderCount; i++) {
			sources[i].assign(embedded[i].ptr,
			                  static_cast<std::size_t>(embedded[i].size));
		}
		return sources;
	}

	std::vector<unsigned char> data;
	std::string filename;
	for (int i = 0; i < ShaderCount; i++) {
		filename.assign("shader/");
		filename.append(ShaderFilenames[i]);
		if (!ReadFile(&data, filename)) {
			FAIL("Could not read shader.", log::Attr{"file", filename});
		}
		sources[i].assign(reinterpret_cast<const char *>(data.data()),
		                  data.size());
	}
	LOG(Info, "Loaded shaders from project directory.",
	    log::Attr{"path", var::ProjectPath.get()});
	return sources;
}

// Get the location of a vertex attribute in the active program.
GLint AttribLocation(std::string_view programName, GLuint program,
                     const char *name) {
	GLint location = glGetAttribLocation(program, name);
	if (location < 0) {
		FAIL("Shader attribute not found.", log::Attr{"program", programName},
		     log::Attr{"attribute", name});
	}
	return location;
}

// Get the location of a uniform in the active program.
GLint UniformLocation(std::string_view programName, GLuint program,
                      const char *name) {
	GLint location = glGetUniformLocation(program, name);
	if (location < 0) {
		FAIL("Shader uniform not found.", log::Attr{"program", programName},
		     log::Attr{"uniform", name});
	}
	return location;
}

} // namespace

FlatProgram Flat;
ColorProgram Color;
CubeProgram Cube;

GLuint CompileShader(GLenum shaderType, std::string_view name,
                     std::string_view source) {
	GLuint shader = glCreateShader(shaderType);
	if (shader == 0) {
		FAIL("Could not create shader.", log::Attr{"shader", name});
	}

	CHECK(source.size() <=
	      static_cast<std::size_t>(std::numeric_limits<GLint>::max()));
	const char *srcText[1] = {source.data()};
	const GLint srcLen[1] = {static_cast<GLint>(source.size())};
	glShaderSource(shader, 1, srcText, srcLen);
	glCompileShader(shader);
	GLint status;
	glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
	if (!status) {
		std::string infoLog = GetShaderLog(shader);
		glDeleteShader(shader);
		FAIL("Shader failed to compile.", log::Attr{"shader", name},
		     log::Attr{"log", infoLog});
	}
	return shader;
}

GLuint LinkProgram(std::string_view name, GLuint vertex, GLuint fragment) {
	GLuint program = glCreateProgram();
	if (program == 0) {
		FAIL("Could not create shader program.", log::Attr{"program", name});
	}

	glAttachShader(program, vertex);
	glAttachShader(program, fragment);
	glLinkProgram(program);
	glDetachShader(program, vertex);
	glDetachShader(program, fragment);
	GLint status;
	glGetProgramiv(program, GL_LINK_STATUS, &status);
	if (!status) {
		std::string infoLog = GetProgramLog(program);
		glDeleteProgram(program);
		FAIL("Shader program failed to link.", log::Attr{"program", name},
		     log::Attr{"log", infoLog});
	}
	return program;
}

void Init() {
	const std::array<std::string, ShaderCount> sources = LoadSources();

	std::array<GLuint, ShaderCount> shaders;
	for (int i = 0; i < ShaderCount; i++) {
		shaders[i] = CompileShader(
			i < VertexShaderCount ? GL_VERTEX_SHADER : GL_FRAGMENT_SHADER,
			ShaderFilenames[i], sources[i]);
	}

	std::array<GLuint, ProgramCount> programs;
	for (int i = 0; i < ProgramCount; i++) {
		const ProgramSpec &spec = ProgramSpecs[i];
		programs[i] = LinkProgram(spec.name, shaders[spec.vertex],
		                          shaders[spec.fragment]);
	}

	for (GLuint shader : shaders) {
		glDeleteShader(shader);
	}

	// Each program is made active before its locations are queried.
	{
		const std::string_view name = ProgramSpecs[FlatProgramId].name;
		const GLuint program = programs[FlatProgramId];
		glUseProgram(program);
		Flat.program = program;
		Flat.position = AttribLocation(name, program, "position");
		Flat.color = UniformLocation(name, program, "Color");
	}
	{
		const std::string_view name = ProgramSpecs[ColorProgramId].name;
		const GLuint program = programs[ColorProgramId];
		glUseProgram(program);
		Color.program = program;
		Color.position = AttribLocation(name, program, "position");
		Color.color = AttribLocation(name, program, "color");
	}
	{
		const std::string_view name = ProgramSpecs[CubeProgramId].name;
		const GLuint program = programs[CubeProgramId];
		glUseProgram(program);
		Cube.program = program;
		Cube.position = AttribLocation(name, program, "position");
		Cube.color = AttribLocation(name, program, "color");
		Cube.matrix = UniformLocation(name, program, "Matrix");
	}
	glUseProgram(0);

	LOG(Debug, "Compiled shaders.", log::Attr{"programs", ProgramCount});
}

} // namespace gl_shader
} // namespace trispin
