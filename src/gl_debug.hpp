// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "gl.hpp"

#include <string_view>

namespace trispin {
namespace log {
class Record;
}

namespace gl_debug {

// Pending OpenGL errors from glGetError, to add to log messages.
class GLError {
public:
	// Drain the OpenGL error queue.
	static GLError Get();

	GLError() : mCount{0}, mErrors{} {}

	bool empty() const { return mCount == 0; }
	int count() const { return mCount; }
	GLenum first() const { return mCount > 0 ? mErrors[0] : GL_NO_ERROR; }

	void AddToRecord(log::Record &record) const;

private:
	static constexpr int MaxErrors = 4;

	int mCount;
	GLenum mErrors[MaxErrors];
};

// Get the name of an OpenGL error code, like "GL_INVALID_ENUM".
std::string_view ErrorName(GLenum error);

// Exit with an error if OpenGL has reported any errors.
void CheckErrors(std::string_view operation);

// Log the context version and renderer.
void LogContextInfo();

// Initialize OpenGL debugging.
void Init();

} // namespace gl_debug
} // namespace trispin
