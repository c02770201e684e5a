// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#define MOIRE_VERSION_MAJOR 1
#define MOIRE_VERSION_MINOR 0
#define MOIRE_VERSION_PATCH 0
#define MOIRE_VERSION "1.0.0"
