// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <array>
#include <cstddef>

namespace trispin {
namespace mesh {

// ============================================================================
// Triangle
// ============================================================================

constexpr int TriangleVertexCount = 3;

// Triangle vertex positions, x and y for each vertex.
extern const float TrianglePositions[TriangleVertexCount * 2];

// Triangle vertex colors, r, g, and b for each vertex.
extern const float TriangleColors[TriangleVertexCount * 3];

// Color of the flat triangle, RGBA.
extern const float FlatTriangleColor[4];

// ============================================================================
// Cube
// ============================================================================

constexpr int CubeFaceCount = 6;
constexpr int CubeVertexCount = CubeFaceCount * 4;
constexpr int CubeIndexCount = CubeFaceCount * 6;
constexpr int CubeArrayVertexCount = CubeFaceCount * 6;

// Face colors, in face order: front (+z), back (-z), top (+y), bottom (-y),
// right (+x), left (-x).
extern const float FaceColors[CubeFaceCount][3];

// Cube corner positions, four vertexes per face, x, y, and z for each vertex.
extern const float CubePositions[CubeVertexCount * 3];

// Cube vertex colors, each face a single color.
extern const float CubeColors[CubeVertexCount * 3];

// Two triangles per face.
extern const unsigned short CubeIndices[CubeIndexCount];

// Cube geometry for drawing without an index buffer.
struct CubeArrays {
	std::array<float, CubeArrayVertexCount * 3> positions;
	std::array<float, CubeArrayVertexCount * 3> colors;
};

// Expand the cube into separate triangles, six vertexes per face, with the
// face color repeated for each vertex.
CubeArrays ExpandCubeArrays();

} // namespace mesh
} // namespace trispin
