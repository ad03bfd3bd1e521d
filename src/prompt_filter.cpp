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

#include "prompt_filter.hpp"

#include "token_estimator.hpp"

#include <optional>

namespace contextfilter
{

FilterOutcome filterPrompt(const std::string& text)
{
    auto start_time = std::chrono::steady_clock::now();

    FilterOutcome outcome;
    outcome.original_text = text;
    outcome.original_chars = text.size();
    outcome.original_tokens = estimateTokens(text);
    outcome.removed = findSections(text);

    std::string filtered;
    filtered.reserve(text.size());

    std::optional<size_t> env_offset;
    size_t cursor = 0;
    for (const auto& section : outcome.removed)
    {
        filtered.append(text, cursor, section.start - cursor);
        if (!env_offset && section.kind == SectionKind::EnvironmentBlock)
        {
            env_offset = filtered.size();
        }
        cursor = section.end;
    }
    filtered.append(text, cursor, std::string::npos);

    outcome.stub_offset = env_offset.value_or(filtered.size());
    filtered.insert(outcome.stub_offset, kEnvironmentStub);

    outcome.filtered_text = std::move(filtered);
    outcome.filtered_chars = outcome.filtered_text.size();
    outcome.filtered_tokens = estimateTokens(outcome.filtered_text);

    outcome.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time);
    return outcome;
}

} // namespace contextfilter
