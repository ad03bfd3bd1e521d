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

#include <cstddef>
#include <string_view>

namespace contextfilter
{

/**
 * @brief Approximate token count of a text (one token per four bytes).
 *
 * Used for log output only, never for filtering decisions.
 */
[[nodiscard]] std::size_t estimateTokens(std::string_view text);

} // namespace contextfilter
