// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "gl.hpp"

#include "log.hpp"

#include <array>
#include <cstring>
#include <string_view>

namespace trispin {
namespace gl_api {

namespace {

// Names of the extensions, in the same order as the Extension enum.
const std::array<std::string_view, ExtensionCount> ExtensionNames = {{
	"GL_KHR_debug",
}};

std::array<bool, ExtensionCount> ExtensionAvailable;

} // namespace

void LoadExtensions() {
	ExtensionAvailable.fill(false);
	int extensionCount = 0;
	glGetIntegerv(GL_NUM_EXTENSIONS, &extensionCount);
	for (int i = 0; i < extensionCount; i++) {
		const char *const ptr =
			reinterpret_cast<const char *>(glGetStringi(GL_EXTENSIONS, i));
		if (ptr == nullptr) {
			continue;
		}
		const std::string_view name{ptr, std::strlen(ptr)};
		for (int j = 0; j < ExtensionCount; j++) {
			if (name == ExtensionNames[j]) {
				ExtensionAvailable[j] = true;
			}
		}
	}
	for (int j = 0; j < ExtensionCount; j++) {
		LOG(Debug, "OpenGL extension.", log::Attr{"name", ExtensionNames[j]},
		    log::Attr{"available", ExtensionAvailable[j]});
	}
}

bool HasExtension(Extension extension) {
	return ExtensionAvailable[static_cast<int>(extension)];
}

} // namespace gl_api
} // namespace trispin
