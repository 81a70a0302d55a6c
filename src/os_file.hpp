// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace trispin {

// Append a relative path to an existing path. The relative path must be
// non-empty and not start with a slash.
void AppendPath(std::string *path, std::string_view view);

// Read a file, relative to the project path, into memory. Errors are logged.
bool ReadFile(std::vector<unsigned char> *data, std::string_view fileName);

} // namespace trispin
