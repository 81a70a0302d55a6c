// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "scene.hpp"

#include <gtest/gtest.h>

namespace trispin {
namespace scene {
namespace {

TEST(SceneTest, LookupByName) {
	EXPECT_EQ(LookupKind("triangle"), Kind::Triangle);
	EXPECT_EQ(LookupKind("color_triangle"), Kind::ColorTriangle);
	EXPECT_EQ(LookupKind("cube"), Kind::Cube);
	EXPECT_EQ(LookupKind("spin_cube"), Kind::SpinCube);
}

TEST(SceneTest, UnknownName) {
	EXPECT_FALSE(LookupKind("").has_value());
	EXPECT_FALSE(LookupKind("Cube").has_value());
	EXPECT_FALSE(LookupKind("teapot").has_value());
}

TEST(SceneTest, NamesRoundTrip) {
	for (Kind kind : {Kind::Triangle, Kind::ColorTriangle, Kind::Cube,
	                  Kind::SpinCube}) {
		EXPECT_EQ(LookupKind(KindName(kind)), kind);
	}
}

} // namespace
} // namespace scene
} // namespace trispin
