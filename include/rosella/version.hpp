//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/rosella/version.hpp
// Purpose: Version constants reported by the rosella tool.
//
//===----------------------------------------------------------------------===//

#pragma once

#define ROSELLA_VERSION_MAJOR 0
#define ROSELLA_VERSION_MINOR 3
#define ROSELLA_VERSION_PATCH 0
#define ROSELLA_VERSION_STR "0.3.0"
