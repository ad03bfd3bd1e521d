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

#include <string>
#include <unordered_set>

namespace contextfilter
{

/**
 * @brief Model identifiers that get their system prompts filtered.
 *
 * Entries are matched exactly. Spelling variants ("llama3.2:1b" and
 * "llama3.2-1b") must each be listed.
 */
using AllowList = std::unordered_set<std::string>;

/**
 * @brief Decide whether a model's requests are filtered.
 * @param model_id Model identifier from the request.
 * @param allow_list Configured allow-list.
 * @return bool True for an exact, case-sensitive member of the allow-list.
 */
[[nodiscard]] bool shouldFilter(const std::string& model_id, const AllowList& allow_list);

} // namespace contextfilter
