// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "scene.hpp"

namespace trispin {
namespace scene {

namespace {

struct KindInfo {
	Kind kind;
	std::string_view name;
};

const KindInfo Kinds[] = {
	{Kind::Triangle, "triangle"},
	{Kind::ColorTriangle, "color_triangle"},
	{Kind::Cube, "cube"},
	{Kind::SpinCube, "spin_cube"},
};

} // namespace

std::optional<Kind> LookupKind(std::string_view name) {
	for (const KindInfo &info : Kinds) {
		if (info.name == name) {
			return info.kind;
		}
	}
	return std::nullopt;
}

std::string_view KindName(Kind kind) {
	for (const KindInfo &info : Kinds) {
		if (info.kind == kind) {
			return info.name;
		}
	}
	return "unknown";
}

} // namespace scene
} // namespace trispin
