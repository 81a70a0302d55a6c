// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <optional>
#include <string_view>

namespace trispin {
namespace scene {

// The available demos.
enum class Kind {
	Triangle,
	ColorTriangle,
	Cube,
	SpinCube,
};

// Look up a demo by its configuration name, like "color_triangle".
std::optional<Kind> LookupKind(std::string_view name);

// Get the configuration name for a demo.
std::string_view KindName(Kind kind);

} // namespace scene
} // namespace trispin
