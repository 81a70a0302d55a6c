// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "gl_shader_data.hpp"

#include <cstring>

namespace trispin {
namespace gl_shader {

// Generated at build time from the shader directory.
extern const char ShaderText[];

std::array<ShaderSource, ShaderCount> GetEmbeddedShaderSource() {
	std::array<ShaderSource, ShaderCount> shaders;
	const char *ptr = ShaderText;
	for (auto &shader : shaders) {
		std::size_t length = std::strlen(ptr);
		shader.ptr = ptr;
		shader.size = static_cast<int>(length);
		ptr += length + 1;
	}
	return shaders;
}

// Keep in sync with SHADER_NAMES in CMakeLists.txt.
extern const std::array<std::string_view, ShaderCount> ShaderFilenames = {{
	"flat.vert",
	"color.vert",
	"cube.vert",
	"flat.frag",
	"color.frag",
}};

extern const std::array<ProgramSpec, ProgramCount> ProgramSpecs = {{
	{"flat", 0, 3},
	{"color", 1, 4},
	{"cube", 2, 4},
}};

} // namespace gl_shader
} // namespace trispin
