// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

namespace trispin {

// Exits the program with an error status code.
[[noreturn]]
void ExitError();

} // namespace trispin
