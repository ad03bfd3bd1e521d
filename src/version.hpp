/*
 * ContextFilter - Prompt Context Filter Proxy for Local LLMs
 * Copyright (c) 2025 ParticleSector.com
 *
 * This software is dual-licensed:
 * - GPL-3.0 for open source use
 * - Commercial license for proprietary use
 *
 * SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-ParticleSector-Commercial
 */

#pragma once

namespace contextfilter
{

struct Version
{
    static constexpr int kMajor = 1;
    static constexpr int kMinor = 0;
    static constexpr int kPatch = 0;
    static constexpr const char* kString = "1.0.0";
};

} // namespace contextfilter
