// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "main.hpp"

#include "gl.hpp"
#include "gl_debug.hpp"
#include "gl_shader.hpp"
#include "log.hpp"
#include "scene.hpp"
#include "scene_color_triangle.hpp"
#include "scene_cube.hpp"
#include "scene_spin_cube.hpp"
#include "scene_triangle.hpp"
#include "var.hpp"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <cstdlib>
#include <optional>
#include <string_view>

#define FAIL_GLFW(...) FAIL(__VA_ARGS__, GLFWErrorInfo::Get())

namespace trispin {
namespace {

// Information about GLFW errors to add to log messages.
class GLFWErrorInfo {
public:
	static GLFWErrorInfo Get() {
		const char *description;
		int error = glfwGetError(&description);
		if (error == 0) {
			return GLFWErrorInfo{};
		}
		return GLFWErrorInfo{error, description};
	}

	GLFWErrorInfo() : mError{0}, mDescription{} {}
	GLFWErrorInfo(int error, const char *description)
		: mError{error},
		  mDescription{description != nullptr ? description : ""} {}

	void AddToRecord(log::Record &record) const {
		record.Add("domain", "GLFW");
		if (mError != 0) {
			record.Add("error", mError);
			record.Add("description", mDescription);
		}
	}

private:
	int mError;
	std::string_view mDescription;
};

extern "C" void ErrorCallback(int error, const char *description) {
	log::Record{log::Level::Error, log::Location::Zero, "GLFW error.",
	            GLFWErrorInfo{error, description}}
		.Log();
}

// Run the frame loop until the window is closed. The frame function is
// called once per frame, after the viewport is set.
template <typename Frame>
void RunLoop(GLFWwindow *window, Frame frame) {
	while (!glfwWindowShouldClose(window)) {
		int width, height;
		glfwGetFramebufferSize(window, &width, &height);
		glViewport(0, 0, width, height);

		frame();

		glfwSwapBuffers(window);
		glfwPollEvents();
	}
}

// Initialize the selected demo and run it.
void RunScene(GLFWwindow *window, scene::Kind kind) {
	LOG(Info, "Running scene.", log::Attr{"scene", scene::KindName(kind)});
	switch (kind) {
	case scene::Kind::Triangle: {
		scene::Triangle triangle;
		triangle.Init();
		RunLoop(window, [&triangle] { triangle.Render(); });
	} break;
	case scene::Kind::ColorTriangle: {
		scene::ColorTriangle triangle;
		triangle.Init();
		RunLoop(window, [&triangle] { triangle.Render(); });
	} break;
	case scene::Kind::Cube: {
		scene::Cube cube;
		cube.Init();
		RunLoop(window, [&cube] {
			cube.Update();
			cube.Render();
		});
	} break;
	case scene::Kind::SpinCube:
		scene::spin_cube::Init();
		RunLoop(window, [] {
			scene::spin_cube::Update();
			scene::spin_cube::Render();
		});
		break;
	}
}

void Main() {
	log::Init();

	const std::optional<scene::Kind> kind =
		scene::LookupKind(var::Scene.get());
	if (!kind.has_value()) {
		FAIL("Unknown scene.", log::Attr{"scene", var::Scene.get()});
	}

	glfwSetErrorCallback(ErrorCallback);
	if (!glfwInit()) {
		FAIL_GLFW("Could not initialize GLFW.");
	}

	// All of these are necessary.
	//
	// - On Apple devices, context will be version 2.1 if no hints are
	//   provided. FORWARD_COMPAT, PROFILE, and VERSION are all required to get
	//   a different result.
	//
	// - On Mesa, 3.0 is the maximum without FORWARD_COMPAT, and 3.1 is the
	//   maximum with FORWARD_COMPAT but without CORE_PROFILE.
	glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
	glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
	glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
	glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);

	if (var::DebugContext.get()) {
		glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GLFW_TRUE);
	}

	GLFWwindow *window =
		glfwCreateWindow(var::WindowWidth.get(), var::WindowHeight.get(),
	                     "trispin", nullptr, nullptr);
	if (window == nullptr) {
		FAIL_GLFW("Could not create window.");
	}

	glfwMakeContextCurrent(window);
	gl_debug::LogContextInfo();
	gl_api::LoadExtensions();
	if (var::DebugContext.get()) {
		gl_debug::Init();
	}
	gl_shader::Init();

	glfwSwapInterval(1);
	RunScene(window, *kind);

	glfwDestroyWindow(window);

	glfwTerminate();
}

} // namespace

[[noreturn]]
void ExitError() {
	glfwTerminate();
	std::exit(1);
}

} // namespace trispin

int main(int argc, char **argv) {
	if (argc > 1) {
		trispin::ParseCommandArguments(argc - 1, argv + 1);
	}
	trispin::Main();
	return 0;
}
