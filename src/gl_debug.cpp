// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "gl_debug.hpp"

#include "log.hpp"

#include <string_view>

namespace trispin {
namespace gl_debug {

namespace {

// Upper bound on how many errors to drain. Without a current context,
// glGetError may never return GL_NO_ERROR.
constexpr int MaxDrain = 32;

std::string_view GetString(GLenum name) {
	const GLubyte *value = glGetString(name);
	if (value == nullptr) {
		return std::string_view{};
	}
	return std::string_view{reinterpret_cast<const char *>(value)};
}

} // namespace

GLError GLError::Get() {
	GLError result;
	for (int i = 0; i < MaxDrain; i++) {
		GLenum error = glGetError();
		if (error == GL_NO_ERROR) {
			break;
		}
		if (result.mCount < MaxErrors) {
			result.mErrors[result.mCount] = error;
		}
		result.mCount++;
	}
	return result;
}

void GLError::AddToRecord(log::Record &record) const {
	record.Add("domain", "OpenGL");
	const int n = mCount < MaxErrors ? mCount : MaxErrors;
	for (int i = 0; i < n; i++) {
		record.Add("error", ErrorName(mErrors[i]));
	}
	if (mCount > n) {
		record.Add("moreErrors", mCount - n);
	}
}

std::string_view ErrorName(GLenum error) {
	switch (error) {
	case GL_NO_ERROR:
		return "GL_NO_ERROR";
	case GL_INVALID_ENUM:
		return "GL_INVALID_ENUM";
	case GL_INVALID_VALUE:
		return "GL_INVALID_VALUE";
	case GL_INVALID_OPERATION:
		return "GL_INVALID_OPERATION";
	case GL_INVALID_FRAMEBUFFER_OPERATION:
		return "GL_INVALID_FRAMEBUFFER_OPERATION";
	case GL_OUT_OF_MEMORY:
		return "GL_OUT_OF_MEMORY";
	default:
		return "unknown";
	}
}

void CheckErrors(std::string_view operation) {
	GLError error = GLError::Get();
	if (!error.empty()) {
		FAIL("OpenGL error.", log::Attr{"operation", operation}, error);
	}
}

void LogContextInfo() {
	LOG(Info, "OpenGL context.", log::Attr{"version", GetString(GL_VERSION)},
	    log::Attr{"renderer", GetString(GL_RENDERER)},
	    log::Attr{"glsl", GetString(GL_SHADING_LANGUAGE_VERSION)});
}

} // namespace gl_debug
} // namespace trispin

#if GL_KHR_debug

namespace trispin {
namespace gl_debug {

namespace {

void APIENTRY DebugCallback(GLenum source, GLenum type, GLuint id,
                            GLenum severity, GLsizei length,
                            const GLchar *message, const void *userParam) {
	(void)source;
	(void)type;
	(void)userParam;

	std::string_view messageText = length < 0
	                                   ? std::string_view{message}
	                                   : std::string_view(message, length);

	log::Level level;
	switch (severity) {
	default:
	case GL_DEBUG_SEVERITY_HIGH:
		level = log::Level::Error;
		break;
	case GL_DEBUG_SEVERITY_MEDIUM:
		level = log::Level::Warn;
		break;
	case GL_DEBUG_SEVERITY_LOW:
		level = log::Level::Info;
		break;
	case GL_DEBUG_SEVERITY_NOTIFICATION:
		level = log::Level::Debug;
		break;
	}

	log::Record{level, log::Location::Zero, "OpenGL",
	            log::Attr("id", id), log::Attr("message", messageText)}
		.Log();
}

} // namespace

void Init() {
	if (!gl_api::HasExtension(gl_api::Extension::KHR_debug)) {
		LOG(Warn, "Debug context requested, but KHR_debug is not available.");
		return;
	}

	LOG(Info, "Using KHR_debug.");
	glDebugMessageCallback(DebugCallback, nullptr);
	glDebugMessageControl(GL_DONT_CARE, GL_DONT_CARE, GL_DONT_CARE, 0, nullptr,
	                      GL_TRUE);
	glEnable(GL_DEBUG_OUTPUT);
	glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS);
}

} // namespace gl_debug
} // namespace trispin

#else

namespace trispin {
namespace gl_debug {

void Init() {
	LOG(Debug, "KHR_debug not available.");
}

} // namespace gl_debug
} // namespace trispin

#endif
