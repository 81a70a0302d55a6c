// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0

// Variable definitions. Don't include this file directly. This must be included
// from a file that defines the following macros:
//
// DEFVAR(name, type, initial, description)

DEFVAR(DebugContext, bool, false, "If true, create a debug OpenGL context.")
DEFVAR(Verbose, bool, false, "If true, log debug messages.")
DEFVAR(Scene, std::string, "cube",
       "Demo to run: triangle, color_triangle, cube, or spin_cube.")
DEFVAR(WindowWidth, int, 640, "Initial window width, in screen coordinates.")
DEFVAR(WindowHeight, int, 480, "Initial window height, in screen coordinates.")
DEFVAR(ProjectPath, std::string, "",
       "Path to the directory containing this project. If set, shaders are "
       "loaded from the shader directory instead of the executable.")
