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

#include "token_estimator.hpp"

namespace contextfilter
{

namespace
{

constexpr std::size_t kCharsPerToken = 4;

}  // namespace

std::size_t estimateTokens(std::string_view text)
{
    return text.size() / kCharsPerToken;
}

} // namespace contextfilter
