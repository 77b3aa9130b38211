//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/pulse/version.hpp
// Purpose: Project version macros.
//
//===----------------------------------------------------------------------===//

#pragma once

#define PULSE_VERSION_MAJOR 0
#define PULSE_VERSION_MINOR 3
#define PULSE_VERSION_PATCH 0
#define PULSE_VERSION_STR "0.3.0"
