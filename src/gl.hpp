// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

// This file provides the OpenGL API.

#if __APPLE__

// ============================================================================
// macOS
// ============================================================================

// On macOS, an OpenGL loader is not necessary. We can just get the definitions
// directly from the OpenGL framework.

// OpenGL is deprecated on macOS. We don't care. This silences the warnings.
#define GL_SILENCE_DEPRECATION 1

#include <OpenGL/gl3.h> // IWYU pragma: export

#ifndef APIENTRY
#define APIENTRY
#endif

#else

// ============================================================================
// Linux
// ============================================================================

// The system libGL exports every core entry point up to the version the driver
// supports, so the prototypes can be used directly without a loader.
#define GL_GLEXT_PROTOTYPES 1

#include <GL/glcorearb.h> // IWYU pragma: export

#endif

// ============================================================================
// Extensions
// ============================================================================

namespace trispin {
namespace gl_api {

// Extensions which the program can use if present.
enum class Extension {
	KHR_debug,
};

constexpr int ExtensionCount = 1;

// Check which extensions are supported by the current context.
void LoadExtensions();

// Return true if the extension is supported by the current context. Only valid
// after LoadExtensions() has been called.
bool HasExtension(Extension extension);

} // namespace gl_api
} // namespace trispin
