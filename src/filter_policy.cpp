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

#include "filter_policy.hpp"

namespace contextfilter
{

bool shouldFilter(const std::string& model_id, const AllowList& allow_list)
{
    return allow_list.find(model_id) != allow_list.end();
}

} // namespace contextfilter
