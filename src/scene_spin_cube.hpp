// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

namespace trispin {
class Spin;

namespace scene {

// A spinning cube drawn as separate triangles, without an index buffer. The
// state is global, so there is only one.
namespace spin_cube {

// Upload the cube, set up render state, and draw the first frame.
void Init();

// Advance the rotation by one frame.
void Update();

void Render();

// Upload the current matrix and issue the draw call.
void Draw();

// Get the current rotation.
const Spin &CurrentSpin();

} // namespace spin_cube
} // namespace scene
} // namespace trispin
