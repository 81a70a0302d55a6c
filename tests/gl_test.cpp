// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0

// Smoke tests which need an OpenGL 3.3 context. These are skipped when no
// display is available.

#include "gl.hpp"
#include "gl_debug.hpp"
#include "gl_shader.hpp"
#include "mesh.hpp"
#include "scene_color_triangle.hpp"
#include "scene_cube.hpp"
#include "scene_spin_cube.hpp"
#include "scene_triangle.hpp"
#include "spin.hpp"
#include "test_support.hpp"
#include "var.hpp"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <gtest/gtest.h>

#include <array>
#include <functional>
#include <string>

namespace trispin {
namespace {

class GLTest : public ::testing::Test {
protected:
	static void SetUpTestSuite() {
		if (!glfwInit()) {
			return;
		}
		glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
		glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
		glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
		glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
		glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
		glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GLFW_TRUE);
		Window = glfwCreateWindow(64, 48, "trispin_test", nullptr, nullptr);
		if (Window == nullptr) {
			glfwTerminate();
			return;
		}
		glfwMakeContextCurrent(Window);
		gl_api::LoadExtensions();
		var::ResetAll();
		gl_shader::Init();
	}

	static void TearDownTestSuite() {
		if (Window != nullptr) {
			glfwDestroyWindow(Window);
			Window = nullptr;
			glfwTerminate();
		}
	}

	void SetUp() override {
		if (Window == nullptr) {
			GTEST_SKIP() << "No OpenGL 3.3 context available.";
		}
		glViewport(0, 0, 64, 48);
	}

	void TearDown() override {
		if (Window != nullptr) {
			gl_debug::GLError error = gl_debug::GLError::Get();
			EXPECT_TRUE(error.empty())
				<< gl_debug::ErrorName(error.first());
		}
	}

	// Count the primitives submitted by a draw function.
	static GLuint CountPrimitives(const std::function<void()> &draw) {
		GLuint query;
		glGenQueries(1, &query);
		glBeginQuery(GL_PRIMITIVES_GENERATED, query);
		draw();
		glEndQuery(GL_PRIMITIVES_GENERATED);
		GLuint count = 0;
		glGetQueryObjectuiv(query, GL_QUERY_RESULT, &count);
		glDeleteQueries(1, &query);
		return count;
	}

	static GLFWwindow *Window;
};

GLFWwindow *GLTest::Window;

std::array<GLfloat, 4> ClearColor() {
	std::array<GLfloat, 4> color;
	glGetFloatv(GL_COLOR_CLEAR_VALUE, color.data());
	return color;
}

bool IsLinked(GLuint program) {
	GLint status = GL_FALSE;
	glGetProgramiv(program, GL_LINK_STATUS, &status);
	return status == GL_TRUE;
}

TEST_F(GLTest, ContextIsCoreProfile) {
	EXPECT_NE(glfwGetCurrentContext(), nullptr);
	GLint major = 0;
	glGetIntegerv(GL_MAJOR_VERSION, &major);
	EXPECT_GE(major, 3);
}

TEST_F(GLTest, ProgramsLinkWithLocations) {
	EXPECT_TRUE(IsLinked(gl_shader::Flat.program));
	EXPECT_TRUE(IsLinked(gl_shader::Color.program));
	EXPECT_TRUE(IsLinked(gl_shader::Cube.program));

	EXPECT_GE(gl_shader::Flat.position, 0);
	EXPECT_GE(gl_shader::Flat.color, 0);
	EXPECT_GE(gl_shader::Color.position, 0);
	EXPECT_GE(gl_shader::Color.color, 0);
	EXPECT_NE(gl_shader::Color.position, gl_shader::Color.color);
	EXPECT_GE(gl_shader::Cube.position, 0);
	EXPECT_GE(gl_shader::Cube.color, 0);
	EXPECT_GE(gl_shader::Cube.matrix, 0);
}

TEST_F(GLTest, CompileFailureExits) {
	EXPECT_THROW(gl_shader::CompileShader(GL_FRAGMENT_SHADER, "broken.frag",
	                                      "#version 330 core\n"
	                                      "void main() { not glsl }\n"),
	             test::FatalError);
	// The failed compile must not leave errors behind.
	EXPECT_TRUE(gl_debug::GLError::Get().empty());
}

TEST_F(GLTest, CompileAndLinkFixedPair) {
	const GLuint vertex = gl_shader::CompileShader(
		GL_VERTEX_SHADER, "test.vert",
		"#version 330 core\nin vec2 position;\n"
		"void main() { gl_Position = vec4(position, 0.0, 1.0); }\n");
	const GLuint fragment = gl_shader::CompileShader(
		GL_FRAGMENT_SHADER, "test.frag",
		"#version 330 core\nout vec4 c;\nvoid main() { c = vec4(1.0); }\n");
	const GLuint program = gl_shader::LinkProgram("test", vertex, fragment);
	EXPECT_TRUE(IsLinked(program));
	glDeleteShader(vertex);
	glDeleteShader(fragment);
	glDeleteProgram(program);
}

TEST_F(GLTest, LoadsShadersFromProjectPath) {
	const gl_shader::CubeProgram embedded = gl_shader::Cube;
	var::ProjectPath.set(TRISPIN_SOURCE_DIR);
	gl_shader::Init();
	var::ResetAll();
	EXPECT_TRUE(IsLinked(gl_shader::Flat.program));
	EXPECT_TRUE(IsLinked(gl_shader::Color.program));
	EXPECT_TRUE(IsLinked(gl_shader::Cube.program));
	EXPECT_NE(gl_shader::Cube.program, embedded.program);
	EXPECT_GE(gl_shader::Cube.matrix, 0);
}

TEST_F(GLTest, TriangleSubmitsOnePrimitive) {
	scene::Triangle triangle;
	triangle.Init();
	EXPECT_EQ(CountPrimitives([&] { triangle.Draw(); }), 1u);
	triangle.Render();
}

TEST_F(GLTest, ColorTriangleSubmitsOnePrimitive) {
	scene::ColorTriangle triangle;
	triangle.Init();
	EXPECT_EQ(CountPrimitives([&] { triangle.Draw(); }), 1u);
	triangle.Render();
	glDisable(GL_DEPTH_TEST);
}

TEST_F(GLTest, CubeSubmitsThirtySixIndexes) {
	scene::Cube cube;
	cube.Init();
	EXPECT_EQ(CountPrimitives([&] { cube.Draw(); }),
	          static_cast<GLuint>(mesh::CubeIndexCount / 3));

	// Draw() leaves the cube's vertex array bound.
	GLint elementBuffer = 0;
	glGetIntegerv(GL_ELEMENT_ARRAY_BUFFER_BINDING, &elementBuffer);
	ASSERT_NE(elementBuffer, 0);
	GLint size = 0;
	glGetBufferParameteriv(GL_ELEMENT_ARRAY_BUFFER, GL_BUFFER_SIZE, &size);
	EXPECT_EQ(size, 36 * static_cast<GLint>(sizeof(unsigned short)));
	glBindVertexArray(0);
	glDisable(GL_DEPTH_TEST);
}

TEST_F(GLTest, CubeUpdateAdvancesRotation) {
	scene::Cube cube;
	cube.Init();
	EXPECT_EQ(cube.spin().steps(), 0);
	cube.Update();
	cube.Render();
	EXPECT_EQ(cube.spin().steps(), 1);
	EXPECT_FLOAT_EQ(cube.spin().angles().z, Spin::StepAngle);
	glDisable(GL_DEPTH_TEST);
}

TEST_F(GLTest, SpinCubeSubmitsThirtySixVertexes) {
	scene::spin_cube::Init();
	EXPECT_EQ(scene::spin_cube::CurrentSpin().steps(), 0);
	EXPECT_EQ(CountPrimitives([] { scene::spin_cube::Draw(); }),
	          static_cast<GLuint>(mesh::CubeArrayVertexCount / 3));
	scene::spin_cube::Update();
	scene::spin_cube::Render();
	EXPECT_EQ(scene::spin_cube::CurrentSpin().steps(), 1);
	glDisable(GL_DEPTH_TEST);
}

TEST_F(GLTest, CubesClearToWhite) {
	const std::array<GLfloat, 4> white = {1.0f, 1.0f, 1.0f, 1.0f};

	glClearColor(0.0f, 0.0f, 0.0f, 0.0f);
	scene::Cube cube;
	cube.Init();
	cube.Render();
	EXPECT_EQ(ClearColor(), white);

	glClearColor(0.0f, 0.0f, 0.0f, 0.0f);
	scene::spin_cube::Init();
	scene::spin_cube::Render();
	EXPECT_EQ(ClearColor(), white);
	glDisable(GL_DEPTH_TEST);
}

#if GL_KHR_debug

void InsertDebugMessage(GLenum severity, GLuint id, const char *message) {
	glDebugMessageInsert(GL_DEBUG_SOURCE_APPLICATION, GL_DEBUG_TYPE_OTHER, id,
	                     severity, -1, message);
}

TEST_F(GLTest, DebugMessageSeverityMapsToLevel) {
	if (!gl_api::HasExtension(gl_api::Extension::KHR_debug)) {
		GTEST_SKIP() << "KHR_debug is not available.";
	}
	const std::string output = test::CaptureLog(true, [] {
		gl_debug::Init();
		InsertDebugMessage(GL_DEBUG_SEVERITY_HIGH, 101, "high");
		InsertDebugMessage(GL_DEBUG_SEVERITY_MEDIUM, 102, "medium");
		InsertDebugMessage(GL_DEBUG_SEVERITY_LOW, 103, "low");
		InsertDebugMessage(GL_DEBUG_SEVERITY_NOTIFICATION, 104,
		                   "notification");
	});
	glDisable(GL_DEBUG_OUTPUT);
	glDebugMessageCallback(nullptr, nullptr);

	EXPECT_NE(output.find("ERROR OpenGL id=101 message=high\n"),
	          std::string::npos)
		<< output;
	EXPECT_NE(output.find("WARN  OpenGL id=102 message=medium\n"),
	          std::string::npos)
		<< output;
	EXPECT_NE(output.find("INFO  OpenGL id=103 message=low\n"),
	          std::string::npos)
		<< output;
	EXPECT_NE(output.find("DEBUG OpenGL id=104 message=notification\n"),
	          std::string::npos)
		<< output;
}

#endif

} // namespace
} // namespace trispin
