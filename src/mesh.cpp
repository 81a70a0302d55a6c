// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "mesh.hpp"

namespace trispin {
namespace mesh {

extern const float TrianglePositions[TriangleVertexCount * 2] = {
	0.0f,  1.0f,  //
	-1.0f, -1.0f, //
	1.0f,  -1.0f, //
};

extern const float TriangleColors[TriangleVertexCount * 3] = {
	1.0f, 0.0f, 0.0f, //
	0.0f, 1.0f, 0.0f, //
	0.0f, 0.0f, 1.0f, //
};

extern const float FlatTriangleColor[4] = {0.9f, 0.35f, 0.1f, 1.0f};

extern const float FaceColors[CubeFaceCount][3] = {
	{1.0f, 0.0f, 0.0f}, // front, red
	{0.0f, 1.0f, 0.0f}, // back, green
	{0.0f, 0.0f, 1.0f}, // top, blue
	{1.0f, 1.0f, 0.0f}, // bottom, yellow
	{1.0f, 0.0f, 1.0f}, // right, magenta
	{0.0f, 1.0f, 1.0f}, // left, cyan
};

// Within each face the corners are ordered so that (0, 1, 2) and (2, 1, 3)
// are the two triangles.
extern const float CubePositions[CubeVertexCount * 3] = {
	// front
	+1, +1, +1, +1, -1, +1, -1, +1, +1, -1, -1, +1, //
	// back
	+1, +1, -1, +1, -1, -1, -1, +1, -1, -1, -1, -1, //
	// top
	+1, +1, +1, +1, +1, -1, -1, +1, +1, -1, +1, -1, //
	// bottom
	+1, -1, +1, +1, -1, -1, -1, -1, +1, -1, -1, -1, //
	// right
	+1, +1, +1, +1, +1, -1, +1, -1, +1, +1, -1, -1, //
	// left
	-1, +1, +1, -1, +1, -1, -1, -1, +1, -1, -1, -1, //
};

extern const float CubeColors[CubeVertexCount * 3] = {
	1, 0, 0, 1, 0, 0, 1, 0, 0, 1, 0, 0, // front
	0, 1, 0, 0, 1, 0, 0, 1, 0, 0, 1, 0, // back
	0, 0, 1, 0, 0, 1, 0, 0, 1, 0, 0, 1, // top
	1, 1, 0, 1, 1, 0, 1, 1, 0, 1, 1, 0, // bottom
	1, 0, 1, 1, 0, 1, 1, 0, 1, 1, 0, 1, // right
	0, 1, 1, 0, 1, 1, 0, 1, 1, 0, 1, 1, // left
};

extern const unsigned short CubeIndices[CubeIndexCount] = {
	0,  1,  2,  2,  1,  3,  //
	4,  5,  6,  6,  5,  7,  //
	8,  9,  10, 10, 9,  11, //
	12, 13, 14, 14, 13, 15, //
	16, 17, 18, 18, 17, 19, //
	20, 21, 22, 22, 21, 23, //
};

CubeArrays ExpandCubeArrays() {
	CubeArrays arrays;
	for (int face = 0; face < CubeFaceCount; face++) {
		for (int i = 0; i < 6; i++) {
			const int src = CubeIndices[face * 6 + i];
			const int dest = face * 6 + i;
			for (int c = 0; c < 3; c++) {
				arrays.positions[dest * 3 + c] = CubePositions[src * 3 + c];
				arrays.colors[dest * 3 + c] = FaceColors[face][c];
			}
		}
	}
	return arrays;
}

} // namespace mesh
} // namespace trispin
