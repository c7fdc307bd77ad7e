// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

// Set from project(VERSION ...) by the build; fallback for out-of-tree compiles
#ifndef HADISCO_VERSION
#define HADISCO_VERSION "0.1.0"
#endif

inline const char* hadisco_version() {
    return HADISCO_VERSION;
}
